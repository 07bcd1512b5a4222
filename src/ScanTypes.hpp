// Data model shared by the walker, the hashing workers and the aggregator.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Digest.hpp"
#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace treedupes
{

namespace fs = std::filesystem;

/// Digest hex -> paths sharing that digest, in the order the aggregator saw them.
/// Only digests seen at least twice have an entry.
using DigestGroups = std::map<std::string, std::vector<fs::path>>;

/// Progress counters, written concurrently by the walker and the aggregator.
/// filesHashed <= filesFound at all times.
struct ScanCounters
{
    std::atomic<uint64_t> filesFound{0};
    std::atomic<uint64_t> filesHashed{0};
};

/// Terminal status of a walk or of a whole scan.
struct Outcome
{
    enum class Status
    {
        Ok,
        Cancelled,
        Failed
    };

    Status status = Status::Ok;
    std::string message;

    static Outcome ok() { return Outcome{}; }
    static Outcome cancelled() { return Outcome{Status::Cancelled, "Operation cancelled."}; }
    static Outcome failed(std::string msg) { return Outcome{Status::Failed, std::move(msg)}; }

    bool isOk() const { return status == Status::Ok; }
    bool isCancelled() const { return status == Status::Cancelled; }
    bool isFailed() const { return status == Status::Failed; }
};

/// Result of hashing one file. error is empty on success.
struct DigestResult
{
    fs::path path;
    Digest digest;
    std::string error;
};

struct HashFailure
{
    fs::path path;
    std::string message;
};

/// Everything a scan produces. Owned by the caller once the scan returned.
struct ScanResult
{
    DigestGroups duplicates;
    std::vector<fs::path> directories;
    std::unordered_map<std::string, Digest> pathDigests;
    size_t uniqueDigests{};
    std::vector<HashFailure> failures;
    size_t droppedResults{};
    Outcome outcome;
};

} // namespace treedupes
