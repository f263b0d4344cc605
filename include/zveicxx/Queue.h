// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace zvei
{

/**
 * Bounded FIFO between one producer and one consumer thread.
 *
 * `close()` wakes both sides; after it, put fails and get drains what is
 * left before failing.
 */
template <typename T, size_t SIZE>
class queue
{
    using buffer_t = std::array<T, SIZE + 1>;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    buffer_t buffer_;
    size_t head_ = 0;
    size_t tail_ = 0;
    bool closed_ = false;

    static size_t next(size_t index) { return (index + 1) % (SIZE + 1); }

    bool full() const { return next(tail_) == head_; }
    bool empty_() const { return head_ == tail_; }

public:
    queue() {}

    /// Enqueue without waiting. Returns false if full or closed.
    bool try_put(const T& value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || full()) return false;
        buffer_[tail_] = value;
        tail_ = next(tail_);
        not_empty_.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    bool put(const T& value, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this]{ return closed_ || !full(); })) return false;
        if (closed_) return false;
        buffer_[tail_] = value;
        tail_ = next(tail_);
        not_empty_.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    bool get(T& value, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]{ return closed_ || !empty_(); })) return false;
        if (empty_()) return false;     // closed and drained
        value = buffer_[head_];
        head_ = next(head_);
        not_full_.notify_one();
        return true;
    }

    /// Wait indefinitely; false once closed and drained.
    bool get(T& value)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]{ return closed_ || !empty_(); });
        if (empty_()) return false;
        value = buffer_[head_];
        head_ = next(head_);
        not_full_.notify_one();
        return true;
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return empty_();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return (tail_ + buffer_.size() - head_) % buffer_.size();
    }

    static constexpr size_t capacity() { return SIZE; }
};

} // zvei
