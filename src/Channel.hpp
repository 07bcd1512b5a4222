// Bounded, closable, cancellable channels for passing work between threads.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <utility>

namespace treedupes
{

/// Wakes a consumer that waits on more than one channel at once.
/// Each channel attached to a notifier bumps its generation on every send and on close.
/// A consumer reads the generation, polls all of its channels and, if nothing was
/// ready, waits until the generation changes. Reading the generation before polling
/// makes the wait free of lost wakeups.
class Notifier
{
public:
    /// Get the current generation.
    uint64_t generation() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return gen;
    }

    /// Announce that some attached channel changed state.
    void notify()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            gen++;
        }
        cv.notify_all();
    }

    /// Wait until the generation differs from seenGeneration or stop is requested.
    /// Return false if the wait ended because of a stop request.
    bool wait(uint64_t seenGeneration, std::stop_token stopToken)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait(lock, stopToken, [&] { return gen != seenGeneration; });
    }

private:
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    uint64_t gen = 0;
};

/// Bounded FIFO queue shared by any number of producers and consumers.
/// All blocking operations return early when the given stop token is signalled.
template <class T>
class Channel
{
public:
    enum class ReceiveStatus
    {
        Received,
        Empty,
        Closed
    };

    /// Create a channel holding at most capacity items.
    explicit Channel(size_t capacity_, std::shared_ptr<Notifier> notifier_ = nullptr)
        : capacity(capacity_), notifier(std::move(notifier_))
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("Channel capacity must be at least 1.");
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Enqueue value, blocking while the channel is full.
    /// Return false (and drop value) if the channel is closed or stop was requested.
    bool send(T value, std::stop_token stopToken)
    {
        {
            std::unique_lock<std::mutex> lock(mutex);
            bool ready = notFull.wait(lock, stopToken, [&] { return closed || items.size() < capacity; });
            if (!ready || closed || stopToken.stop_requested())
            {
                return false;
            }
            items.push_back(std::move(value));
        }
        notEmpty.notify_one();
        if (notifier)
        {
            notifier->notify();
        }
        return true;
    }

    /// Dequeue the next value, blocking while the channel is empty and open.
    /// Return nothing once the channel is closed and drained, or if stop was requested.
    std::optional<T> receive(std::stop_token stopToken)
    {
        std::optional<T> r;
        {
            std::unique_lock<std::mutex> lock(mutex);
            bool ready = notEmpty.wait(lock, stopToken, [&] { return closed || !items.empty(); });
            if (!ready || items.empty() || stopToken.stop_requested())
            {
                return r;
            }
            r.emplace(std::move(items.front()));
            items.pop_front();
        }
        notFull.notify_one();
        return r;
    }

    /// Dequeue the next value without blocking.
    ReceiveStatus tryReceive(T& value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (items.empty())
            {
                return closed ? ReceiveStatus::Closed : ReceiveStatus::Empty;
            }
            value = std::move(items.front());
            items.pop_front();
        }
        notFull.notify_one();
        return ReceiveStatus::Received;
    }

    /// Close the channel. Buffered items remain receivable. Closing twice is a no-op.
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed)
            {
                return;
            }
            closed = true;
        }
        notEmpty.notify_all();
        notFull.notify_all();
        if (notifier)
        {
            notifier->notify();
        }
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

private:
    const size_t capacity;
    std::shared_ptr<Notifier> notifier;
    mutable std::mutex mutex;
    std::condition_variable_any notEmpty;
    std::condition_variable_any notFull;
    std::deque<T> items;
    bool closed = false;
};

} // namespace treedupes
