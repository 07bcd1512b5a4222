// Turn termination signals into a stop request.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "SignalWatcher.hpp"
#include "MiscUtils.hpp"
#include <csignal>
#include <cstring>
#include <ctime>
#include <pthread.h>
#include <stdexcept>

namespace treedupes
{

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, std::stop_source scanStop_, Log& log_)
    : scanStop(std::move(scanStop_)), log(log_)
{
    sigemptyset(&signalSet);
    for (int sig : signals)
    {
        sigaddset(&signalSet, sig);
    }
    int err = pthread_sigmask(SIG_BLOCK, &signalSet, nullptr);
    if (err != 0)
    {
        throw std::runtime_error(std::string("Failed to block signals: ") + std::strerror(err));
    }
    blocked = true;
}

SignalWatcher::~SignalWatcher()
{
    stop();
}

void SignalWatcher::start()
{
    watcher = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
}

void SignalWatcher::stop()
{
    watcher.request_stop();
    if (watcher.joinable())
    {
        watcher.join();
    }
    if (blocked)
    {
        // A signal that arrived after the watcher ended is delivered right here.
        pthread_sigmask(SIG_UNBLOCK, &signalSet, nullptr);
        blocked = false;
    }
}

void SignalWatcher::run(std::stop_token stopToken)
{
    timespec timeout{0, 200 * 1000 * 1000};
    bool cancelled = false;
    while (!stopToken.stop_requested())
    {
        int sig = sigtimedwait(&signalSet, nullptr, &timeout);
        if (sig <= 0)
        {
            continue;
        }
        if (!cancelled)
        {
            log.warning("Received signal " + ut1::toStr(sig) + ", cancelling. Send it again to exit immediately.");
            scanStop.request_stop();
            cancelled = true;
            continue;
        }

        log.warning("Received signal " + ut1::toStr(sig) + " again, exiting.");
        std::signal(sig, SIG_DFL);
        sigset_t single;
        sigemptyset(&single);
        sigaddset(&single, sig);
        pthread_sigmask(SIG_UNBLOCK, &single, nullptr);
        raise(sig);
        return;
    }
}

} // namespace treedupes
