// Human readable output of scan and consolidation results.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Report.hpp"
#include "MiscUtils.hpp"
#include <algorithm>
#include <iomanip>
#include <system_error>

namespace treedupes
{

void printStatList(const std::vector<StatLine>& lines, std::ostream& os)
{
    size_t labelWidth = 0;
    size_t valueWidth = 0;
    for (const auto& line : lines)
    {
        labelWidth = std::max(labelWidth, line.label.size());
        valueWidth = std::max(valueWidth, line.value.size());
    }
    for (const auto& line : lines)
    {
        os << std::left << std::setw(static_cast<int>(labelWidth)) << line.label << " "
           << std::right << std::setw(static_cast<int>(valueWidth)) << line.value;
        if (!line.extra.empty())
        {
            os << " " << line.extra;
        }
        os << "\n";
    }
}

void printDuplicates(const DigestGroups& duplicates, std::ostream& os)
{
    if (duplicates.empty())
    {
        os << "No duplicates found.\n";
        return;
    }
    for (const auto& [hex, paths] : duplicates)
    {
        os << hex << ":\n";
        for (const auto& path : paths)
        {
            os << "  " << path.string() << "\n";
        }
    }
}

void printDirectories(const std::vector<fs::path>& directories, std::ostream& os)
{
    for (const auto& dir : directories)
    {
        os << dir.string() << "\n";
    }
}

void printDryRun(const DigestGroups& duplicates, std::ostream& os)
{
    for (const auto& [hex, paths] : duplicates)
    {
        for (size_t i = 1; i < paths.size(); i++)
        {
            os << "Would hardlink " << paths[i].string() << " -> " << paths.front().string() << "\n";
        }
    }
}

uint64_t getRedundantSize(const DigestGroups& duplicates)
{
    uint64_t total = 0;
    for (const auto& [hex, paths] : duplicates)
    {
        std::error_code ec;
        uint64_t size = fs::file_size(paths.front(), ec);
        if (ec)
        {
            continue;
        }
        for (size_t i = 1; i < paths.size(); i++)
        {
            // Links to the first file occupy no extra space.
            if (!fs::equivalent(paths.front(), paths[i], ec))
            {
                total += size;
            }
        }
    }
    return total;
}

std::vector<StatLine> getScanStats(const ScanResult& result, const ScanCounters& counters, double elapsedSeconds)
{
    size_t duplicateFiles = 0;
    for (const auto& [hex, paths] : result.duplicates)
    {
        duplicateFiles += paths.size() - 1;
    }
    std::vector<StatLine> lines = {
        {"files-found:", ut1::toStr(counters.filesFound.load()), std::string()},
        {"files-hashed:", ut1::toStr(counters.filesHashed.load()), std::string()},
        {"hash-failures:", ut1::toStr(result.failures.size()), std::string()},
        {"unique-digests:", ut1::toStr(result.uniqueDigests), std::string()},
        {"duplicate-groups:", ut1::toStr(result.duplicates.size()), std::string()},
        {"duplicate-files:", ut1::toStr(duplicateFiles), std::string()},
        {"redundant-size:", ut1::getApproxSizeStr(getRedundantSize(result.duplicates), 3, true, false), std::string()},
        {"dirs:", ut1::toStr(result.directories.size()), "(excluding root)"},
        {"elapsed:", ut1::secondsToString(elapsedSeconds), std::string()}
    };
    if (result.droppedResults > 0)
    {
        lines.push_back({"dropped-results:", ut1::toStr(result.droppedResults), std::string()});
    }
    return lines;
}

std::vector<StatLine> getConsolidationStats(const DuplicateConsolidator::Stats& stats)
{
    std::vector<StatLine> lines = {
        {"hardlinks-created:", ut1::toStr(stats.replacedFiles), std::string()},
        {"already-linked:", ut1::toStr(stats.alreadyLinked), std::string()},
        {"skipped:", ut1::toStr(stats.skipped), std::string()},
        {"reclaimed-size:", ut1::getApproxSizeStr(stats.reclaimedBytes, 3, true, false), std::string()}
    };
    if (stats.dataLossRisks > 0)
    {
        lines.push_back({"removed-but-not-linked:", ut1::toStr(stats.dataLossRisks), "(see errors above)"});
    }
    return lines;
}

} // namespace treedupes
