// Concurrent scan of a directory tree: walker, hashing workers and aggregator.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Log.hpp"
#include "ScanTypes.hpp"
#include <stop_token>

namespace treedupes
{

struct ScanOptions
{
    size_t numWorkers = 1;
    size_t queueSize = 64;
};

/// Find all regular files under root, hash them with digestFunction on numWorkers threads
/// and group paths by digest.
///
/// counters is updated while the scan runs and may be read concurrently (e.g. for progress).
/// Throws std::invalid_argument, before any thread is started, if digestFunction is empty,
/// numWorkers < 1 or queueSize < 1.
/// Per-file hash errors and unreadable subdirectories are reported as warnings and never
/// end the scan. On a stop request the result is partial and its outcome is Cancelled,
/// if the root cannot be walked the outcome is Failed. All threads have terminated when this returns.
ScanResult runScan(const fs::path& root, const DigestFunction& digestFunction, const ScanOptions& options,
                   ScanCounters& counters, std::stop_token stopToken, Log& log);

} // namespace treedupes
