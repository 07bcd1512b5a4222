// Fan-in of directory events, digest results and the walk outcome into the result tables.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Channel.hpp"
#include "Log.hpp"
#include "ScanTypes.hpp"
#include <stop_token>
#include <string>
#include <unordered_map>

namespace treedupes
{

/// Single owner of the result tables of one scan.
/// All three sources must be attached to the same Notifier.
class ResultAggregator
{
public:
    /// stopSource is requested when the aggregator gives up early (cancellation or walk failure)
    /// so that every producer unblocks. It must be the source of the producers' stop tokens.
    ResultAggregator(ScanCounters& counters_, Log& log_, std::stop_source stopSource_)
        : counters(counters_), log(log_), stopSource(std::move(stopSource_)) {}

    /// Drain all sources until each one is closed, then return the tables.
    /// Returns early with partial tables when cancellation is observed or the walk failed.
    /// May be called only once.
    ScanResult drain(Channel<fs::path>& dirPaths, Channel<DigestResult>& results, Channel<Outcome>& walkOutcome, Notifier& notifier);

private:
    enum class SourceState
    {
        Open,
        Exhausted
    };

    /// Poll every open source once. Return true if at least one item was processed.
    bool pollSources(Channel<fs::path>& dirPaths, Channel<DigestResult>& results, Channel<Outcome>& walkOutcome);

    /// Discard everything already buffered in the sources, without blocking.
    void dropBuffered(Channel<fs::path>& dirPaths, Channel<DigestResult>& results, Channel<Outcome>& walkOutcome);

    void addResult(DigestResult result);

    bool allExhausted() const
    {
        return dirState == SourceState::Exhausted && resultState == SourceState::Exhausted && outcomeState == SourceState::Exhausted;
    }

    ScanCounters& counters;
    Log& log;
    std::stop_source stopSource;

    SourceState dirState = SourceState::Open;
    SourceState resultState = SourceState::Open;
    SourceState outcomeState = SourceState::Open;

    /// Digest hex -> first path seen with it.
    std::unordered_map<std::string, fs::path> firstSeen;
    ScanResult result;
};

} // namespace treedupes
