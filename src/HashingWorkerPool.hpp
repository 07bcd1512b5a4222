// Fixed-size pool of threads computing file digests.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Channel.hpp"
#include "Log.hpp"
#include "ScanTypes.hpp"
#include <atomic>
#include <stop_token>
#include <thread>
#include <vector>

namespace treedupes
{

/// Workers read paths from one shared channel and send one DigestResult per path.
/// Results of different workers arrive in no particular order.
class HashingWorkerPool
{
public:
    /// Throws std::invalid_argument if numWorkers < 1 or digestFunction is empty.
    HashingWorkerPool(size_t numWorkers_, DigestFunction digestFunction_, Log& log_);

    /// Joins all workers.
    ~HashingWorkerPool();

    HashingWorkerPool(const HashingWorkerPool&) = delete;
    HashingWorkerPool& operator=(const HashingWorkerPool&) = delete;

    /// Start all workers. results is closed when the last worker has terminated.
    /// Workers terminate when filePaths is closed and drained, or on a stop request.
    /// A result that cannot be sent because of a stop request is dropped.
    void start(Channel<fs::path>& filePaths, Channel<DigestResult>& results, std::stop_token stopToken);

    /// Wait for all workers to terminate.
    void join();

    size_t getNumWorkers() const { return numWorkers; }

private:
    /// Worker main loop.
    void work(Channel<fs::path>& filePaths, Channel<DigestResult>& results, std::stop_token stopToken);

    /// Hash one file, turning exceptions into an error message.
    DigestResult hashOne(fs::path path) const;

    size_t numWorkers;
    DigestFunction digestFunction;
    Log& log;
    std::atomic<size_t> activeWorkers{0};
    std::vector<std::jthread> workers;
};

} // namespace treedupes
