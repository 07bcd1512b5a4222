// Human readable output of scan and consolidation results.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "DuplicateConsolidator.hpp"
#include "ScanTypes.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace treedupes
{

struct StatLine
{
    std::string label;
    std::string value;
    std::string extra;
};

/// Print aligned statistics lines.
void printStatList(const std::vector<StatLine>& lines, std::ostream& os = std::cout);

/// Print every duplicate group: digest followed by its paths, original first.
void printDuplicates(const DigestGroups& duplicates, std::ostream& os = std::cout);

/// Print all discovered directories.
void printDirectories(const std::vector<fs::path>& directories, std::ostream& os = std::cout);

/// Print what a consolidation would do, without touching the filesystem.
void printDryRun(const DigestGroups& duplicates, std::ostream& os = std::cout);

/// Sum of the sizes of all files that consolidation would free (all but the first of each group,
/// not counting paths that already are hardlinks to the first one).
uint64_t getRedundantSize(const DigestGroups& duplicates);

/// Build the summary statistics of a scan.
std::vector<StatLine> getScanStats(const ScanResult& result, const ScanCounters& counters, double elapsedSeconds);

/// Build the statistics of a consolidation.
std::vector<StatLine> getConsolidationStats(const DuplicateConsolidator::Stats& stats);

} // namespace treedupes
