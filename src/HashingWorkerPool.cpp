// Fixed-size pool of threads computing file digests.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "HashingWorkerPool.hpp"
#include "MiscUtils.hpp"
#include <stdexcept>

namespace treedupes
{

HashingWorkerPool::HashingWorkerPool(size_t numWorkers_, DigestFunction digestFunction_, Log& log_)
    : numWorkers(numWorkers_), digestFunction(std::move(digestFunction_)), log(log_)
{
    if (numWorkers < 1)
    {
        throw std::invalid_argument("Number of workers must be at least 1, got " + ut1::toStr(numWorkers) + ".");
    }
    if (!digestFunction)
    {
        throw std::invalid_argument("No digest function specified.");
    }
}

HashingWorkerPool::~HashingWorkerPool()
{
    join();
}

void HashingWorkerPool::start(Channel<fs::path>& filePaths, Channel<DigestResult>& results, std::stop_token stopToken)
{
    if (!workers.empty())
    {
        throw std::logic_error("HashingWorkerPool already started.");
    }
    activeWorkers = numWorkers;
    workers.reserve(numWorkers);
    for (size_t i = 0; i < numWorkers; i++)
    {
        workers.emplace_back([this, &filePaths, &results, stopToken]
        {
            work(filePaths, results, stopToken);
        });
    }
}

void HashingWorkerPool::join()
{
    for (auto& worker : workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

void HashingWorkerPool::work(Channel<fs::path>& filePaths, Channel<DigestResult>& results, std::stop_token stopToken)
{
    while (std::optional<fs::path> path = filePaths.receive(stopToken))
    {
        DigestResult result = hashOne(std::move(*path));
        if (!results.send(std::move(result), stopToken))
        {
            log.info("Dropping result after cancellation.", 2);
            break;
        }
    }
    if (--activeWorkers == 0)
    {
        results.close();
    }
}

DigestResult HashingWorkerPool::hashOne(fs::path path) const
{
    log.info("Hashing " + path.string(), 2);
    DigestResult result;
    try
    {
        result.digest = digestFunction(path);
    }
    catch (const std::exception& e)
    {
        result.error = e.what();
    }
    result.path = std::move(path);
    return result;
}

} // namespace treedupes
