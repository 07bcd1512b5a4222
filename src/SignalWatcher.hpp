// Turn termination signals into a stop request.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Log.hpp"
#include <initializer_list>
#include <signal.h>
#include <stop_token>
#include <thread>

namespace treedupes
{

/// Blocks a set of signals and consumes them in a dedicated thread.
/// The first signal requests stop on scanStop, a second one of the same set
/// terminates the process with the default action of that signal.
///
/// The constructor blocks the signals in the calling thread, so it must run before
/// any other thread is started, and stop() must be called from that same thread.
class SignalWatcher
{
public:
    SignalWatcher(std::initializer_list<int> signals, std::stop_source scanStop_, Log& log_);

    /// Calls stop().
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Start the watcher thread.
    void start();

    /// Stop the watcher thread and unblock the signals in the calling thread.
    /// Signals arriving afterwards get their default action. Calling this twice is a no-op.
    void stop();

private:
    void run(std::stop_token stopToken);

    sigset_t signalSet;
    std::stop_source scanStop;
    Log& log;
    bool blocked = false;
    std::jthread watcher;
};

} // namespace treedupes
