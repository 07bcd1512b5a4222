// Once-per-second progress line for a running scan.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Log.hpp"
#include "ScanTypes.hpp"
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace treedupes
{

class ProgressTracker
{
public:
    /// Initialize progress tracking with width and linefeed mode.
    /// Lines are written through log so that they never interleave with log messages.
    ProgressTracker(const ScanCounters& counters_, Log& log_, size_t maxWidth_ = 199, bool linefeed_ = false);

    /// Stops the reporter thread.
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /// Start printing the progress line once per second in a background thread.
    void start();

    /// Stop the background thread and print the final state on its own line.
    void finish();

    /// Render one progress line for the given time.
    std::string formatLine(double now) const;

private:
    /// Reporter thread main loop.
    void run(std::stop_token stopToken);

    /// Print an updated progress line.
    void printLine(double now, bool final);

    const ScanCounters& counters;
    Log& log;
    double startTime = 0.0;
    size_t lastLineLen = 0;
    size_t maxWidth = 199;
    bool linefeed = false;
    bool finished = false;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::jthread reporter;
};

} // namespace treedupes
