// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Console output for the monitor. Lines are queued by whichever thread
// produces them and written by one writer thread, so a stalled terminal
// or stderr pipe never holds up decoding.

#pragma once

#include "Numerology.h"
#include "Queue.h"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

namespace zvei
{

class ConsoleLog
{
public:
    using queue_t = queue<std::string, console_queue_depth>;

    explicit ConsoleLog(std::ostream& out = std::cerr)
    : out_(out)
    {}

    ~ConsoleLog()
    {
        close();
    }

    ConsoleLog(const ConsoleLog&) = delete;
    ConsoleLog& operator=(const ConsoleLog&) = delete;

    void start()
    {
        if (thread_.joinable()) return;
        thread_ = std::thread([this](){ run(); });
    }

    /// Queue one line (no trailing newline). Never waits; returns false and
    /// counts the line as dropped when the queue is full or closed.
    bool operator()(const std::string& line)
    {
        if (queue_.try_put(line)) return true;
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    /// Write everything queued and stop the writer thread.
    void close()
    {
        queue_.close();
        if (thread_.joinable()) thread_.join();
    }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    void run()
    {
        std::string line;
        while (queue_.get(line))
        {
            out_ << line << '\n';
            if (queue_.empty()) out_.flush();
        }
        out_.flush();
    }

    std::ostream& out_;
    queue_t queue_;
    std::thread thread_;
    std::atomic<uint64_t> dropped_{0};
};

} // zvei
