// Once-per-second progress line for a running scan.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ProgressTracker.hpp"
#include "MiscUtils.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace treedupes
{

ProgressTracker::ProgressTracker(const ScanCounters& counters_, Log& log_, size_t maxWidth_, bool linefeed_)
    : counters(counters_),
      log(log_),
      startTime(ut1::getTimeSec()),
      maxWidth(maxWidth_),
      linefeed(linefeed_) {}

ProgressTracker::~ProgressTracker()
{
    reporter.request_stop();
    if (reporter.joinable())
    {
        reporter.join();
    }
}

void ProgressTracker::start()
{
    reporter = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
}

void ProgressTracker::finish()
{
    reporter.request_stop();
    if (reporter.joinable())
    {
        reporter.join();
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (!finished)
    {
        finished = true;
        printLine(ut1::getTimeSec(), true);
    }
}

std::string ProgressTracker::formatLine(double now) const
{
    uint64_t found = counters.filesFound.load();
    uint64_t hashed = counters.filesHashed.load();
    double elapsed = now - startTime;
    double avgRate = (elapsed > 0.0) ? (double(hashed) / elapsed) : 0.0;
    std::ostringstream rate;
    rate << std::fixed << std::setprecision(1) << avgRate;
    std::string line = "Found " + ut1::toStr(found) + " files, hashed " + ut1::toStr(hashed)
        + " files (" + rate.str() + " files/s, " + ut1::secondsToString(elapsed) + ")";
    if (line.size() > maxWidth)
    {
        line.resize(maxWidth);
    }
    return line;
}

void ProgressTracker::run(std::stop_token stopToken)
{
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopToken.stop_requested())
    {
        // Returns early only on a stop request.
        cv.wait_for(lock, stopToken, std::chrono::seconds(1), [] { return false; });
        if (stopToken.stop_requested())
        {
            break;
        }
        printLine(ut1::getTimeSec(), false);
    }
}

void ProgressTracker::printLine(double now, bool final)
{
    std::string line = formatLine(now);
    if (final)
    {
        line += " done";
    }
    if (linefeed)
    {
        log.write(line + "\n");
    }
    else
    {
        size_t pad = (lastLineLen > line.size()) ? (lastLineLen - line.size()) : 0;
        log.write("\r" + line + std::string(pad, ' ') + (final ? "\n" : "\r"));
        lastLineLen = final ? 0 : line.size();
    }
}

} // namespace treedupes
