// Concurrent scan of a directory tree: walker, hashing workers and aggregator.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ScanPipeline.hpp"
#include "Channel.hpp"
#include "HashingWorkerPool.hpp"
#include "MiscUtils.hpp"
#include "ResultAggregator.hpp"
#include "TreeWalker.hpp"
#include <memory>
#include <stdexcept>
#include <thread>

namespace treedupes
{

ScanResult runScan(const fs::path& root, const DigestFunction& digestFunction, const ScanOptions& options,
                   ScanCounters& counters, std::stop_token stopToken, Log& log)
{
    if (!digestFunction)
    {
        throw std::invalid_argument("No digest function specified.");
    }
    if (options.numWorkers < 1)
    {
        throw std::invalid_argument("Number of workers must be at least 1, got " + ut1::toStr(options.numWorkers) + ".");
    }
    if (options.queueSize < 1)
    {
        throw std::invalid_argument("Queue size must be at least 1.");
    }

    // Pipeline-local stop source: requested by the caller's token or by the aggregator.
    std::stop_source stopSource;
    std::stop_callback forwardStop(stopToken, [&stopSource] { stopSource.request_stop(); });

    auto notifier = std::make_shared<Notifier>();
    Channel<fs::path> filePaths(options.queueSize);
    Channel<fs::path> dirPaths(options.queueSize, notifier);
    Channel<DigestResult> results(options.queueSize, notifier);
    Channel<Outcome> walkOutcome(1, notifier);

    HashingWorkerPool pool(options.numWorkers, digestFunction, log);
    TreeWalker walker(root, counters, log);
    ResultAggregator aggregator(counters, log, stopSource);

    log.info("Scanning " + root.string() + " with " + ut1::toStr(options.numWorkers) + " hashing workers.");
    ScanResult result;
    {
        std::jthread walkerThread([&walker, &filePaths, &dirPaths, &walkOutcome, token = stopSource.get_token()]
        {
            walker.run(filePaths, dirPaths, walkOutcome, token);
        });
        try
        {
            pool.start(filePaths, results, stopSource.get_token());
            result = aggregator.drain(dirPaths, results, walkOutcome, *notifier);
        }
        catch (const std::exception&)
        {
            // Unblock the walker and the workers so that the joins below terminate.
            stopSource.request_stop();
            throw;
        }

        // The aggregator returns early only after requesting stop, so both joins terminate.
        pool.join();
    }
    log.info("Scan finished: " + ut1::toStr(counters.filesFound.load()) + " files found, "
             + ut1::toStr(counters.filesHashed.load()) + " hashed.");
    return result;
}

} // namespace treedupes
