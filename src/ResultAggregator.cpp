// Fan-in of directory events, digest results and the walk outcome into the result tables.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ResultAggregator.hpp"
#include "MiscUtils.hpp"

namespace treedupes
{

ScanResult ResultAggregator::drain(Channel<fs::path>& dirPaths, Channel<DigestResult>& results, Channel<Outcome>& walkOutcome, Notifier& notifier)
{
    std::stop_token stopToken = stopSource.get_token();
    bool stoppedEarly = false;
    while (!allExhausted())
    {
        if (stopToken.stop_requested())
        {
            result.outcome = Outcome::cancelled();
            stoppedEarly = true;
            break;
        }

        uint64_t generation = notifier.generation();
        if (pollSources(dirPaths, results, walkOutcome))
        {
            if (result.outcome.isFailed())
            {
                stoppedEarly = true;
                break;
            }
            continue;
        }
        if (allExhausted())
        {
            break;
        }
        notifier.wait(generation, stopToken);
    }

    // The producers may have closed their channels in reaction to a stop request that
    // this loop has not seen yet. The tables are partial in that case too.
    if (!stoppedEarly && stopToken.stop_requested())
    {
        result.outcome = Outcome::cancelled();
    }

    if (stoppedEarly)
    {
        stopSource.request_stop();
        dropBuffered(dirPaths, results, walkOutcome);
        if (result.droppedResults > 0)
        {
            log.info("Dropped " + ut1::toStr(result.droppedResults) + " results after the scan was stopped.");
        }
    }

    result.uniqueDigests = firstSeen.size();
    firstSeen.clear();
    return std::move(result);
}

bool ResultAggregator::pollSources(Channel<fs::path>& dirPaths, Channel<DigestResult>& results, Channel<Outcome>& walkOutcome)
{
    bool processed = false;

    if (dirState == SourceState::Open)
    {
        fs::path dirPath;
        switch (dirPaths.tryReceive(dirPath))
        {
            case Channel<fs::path>::ReceiveStatus::Received:
                result.directories.push_back(std::move(dirPath));
                processed = true;
                break;
            case Channel<fs::path>::ReceiveStatus::Closed:
                dirState = SourceState::Exhausted;
                break;
            case Channel<fs::path>::ReceiveStatus::Empty:
                break;
        }
    }

    if (resultState == SourceState::Open)
    {
        DigestResult digestResult;
        switch (results.tryReceive(digestResult))
        {
            case Channel<DigestResult>::ReceiveStatus::Received:
                addResult(std::move(digestResult));
                processed = true;
                break;
            case Channel<DigestResult>::ReceiveStatus::Closed:
                resultState = SourceState::Exhausted;
                break;
            case Channel<DigestResult>::ReceiveStatus::Empty:
                break;
        }
    }

    if (outcomeState == SourceState::Open)
    {
        Outcome outcome;
        switch (walkOutcome.tryReceive(outcome))
        {
            case Channel<Outcome>::ReceiveStatus::Received:
                if (outcome.isFailed())
                {
                    log.error(outcome.message);
                    result.outcome = std::move(outcome);
                }
                processed = true;
                break;
            case Channel<Outcome>::ReceiveStatus::Closed:
                outcomeState = SourceState::Exhausted;
                break;
            case Channel<Outcome>::ReceiveStatus::Empty:
                break;
        }
    }

    return processed;
}

void ResultAggregator::dropBuffered(Channel<fs::path>& dirPaths, Channel<DigestResult>& results, Channel<Outcome>& walkOutcome)
{
    fs::path dirPath;
    while (dirPaths.tryReceive(dirPath) == Channel<fs::path>::ReceiveStatus::Received)
    {
    }
    DigestResult digestResult;
    while (results.tryReceive(digestResult) == Channel<DigestResult>::ReceiveStatus::Received)
    {
        result.droppedResults++;
    }
    Outcome outcome;
    while (walkOutcome.tryReceive(outcome) == Channel<Outcome>::ReceiveStatus::Received)
    {
    }
}

void ResultAggregator::addResult(DigestResult digestResult)
{
    if (!digestResult.error.empty())
    {
        log.warning("Error hashing file " + digestResult.path.string() + ": " + digestResult.error);
        result.failures.push_back(HashFailure{std::move(digestResult.path), std::move(digestResult.error)});
        return;
    }

    counters.filesHashed++;
    std::string hex = toHex(digestResult.digest);
    result.pathDigests[digestResult.path.string()] = std::move(digestResult.digest);

    auto first = firstSeen.find(hex);
    if (first == firstSeen.end())
    {
        firstSeen.emplace(std::move(hex), std::move(digestResult.path));
        return;
    }
    auto& group = result.duplicates[hex];
    if (group.empty())
    {
        group.push_back(first->second);
    }
    group.push_back(std::move(digestResult.path));
}

} // namespace treedupes
