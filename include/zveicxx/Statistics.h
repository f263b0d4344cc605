// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "SequenceDecoder.h"
#include "ToneDetector.h"
#include "ToneTable.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace zvei
{

/**
 * Process-lifetime counters fed from the pipeline's event stream.
 *
 * Every counter is an independent atomic: producers never block, and a
 * snapshot never sees a torn value. A snapshot taken while the pipeline
 * runs may mix counts from adjacent blocks.
 */
class Statistics
{
public:
    using clock_t = std::chrono::system_clock;
    using uptime_clock_t = std::chrono::steady_clock;

    struct Snapshot
    {
        clock_t::time_point start_time;     // for display only
        double uptime = 0;                  // seconds, monotonic
        uint64_t samples = 0;
        uint64_t blocks = 0;
        uint64_t observations = 0;
        uint64_t tone_observations = 0;
        std::array<uint64_t, tone_count> symbol_counts{};
        uint64_t sequences_completed = 0;
        uint64_t sequences_aborted = 0;
        std::array<uint64_t, abort_reason_count> aborts_by_reason{};
        uint64_t records_dropped = 0;
        uint64_t max_block_us = 0;

        uint64_t aborted(AbortReason reason) const
        {
            return aborts_by_reason[static_cast<size_t>(reason)];
        }

        uint64_t count(ToneSymbol symbol) const
        {
            return symbol_counts[index_of(symbol)];
        }
    };

    Statistics()
    : start_time_(clock_t::now())
    , started_(uptime_clock_t::now())
    {
        for (auto& c : symbol_counts_) c = 0;
        for (auto& c : aborts_by_reason_) c = 0;
    }

    Statistics(const Statistics&) = delete;
    Statistics& operator=(const Statistics&) = delete;

    void block(size_t samples, uint64_t elapsed_us)
    {
        samples_.fetch_add(samples, std::memory_order_relaxed);
        blocks_.fetch_add(1, std::memory_order_relaxed);

        uint64_t current = max_block_us_.load(std::memory_order_relaxed);
        while (elapsed_us > current &&
            !max_block_us_.compare_exchange_weak(current, elapsed_us, std::memory_order_relaxed))
        {}
    }

    void observation(const ToneObservation& obs)
    {
        observations_.fetch_add(1, std::memory_order_relaxed);
        if (obs.symbol)
        {
            tone_observations_.fetch_add(1, std::memory_order_relaxed);
            symbol_counts_[index_of(*obs.symbol)].fetch_add(1, std::memory_order_relaxed);
        }
    }

    void completed(const SequenceRecord&)
    {
        sequences_completed_.fetch_add(1, std::memory_order_relaxed);
    }

    void aborted(AbortReason reason)
    {
        sequences_aborted_.fetch_add(1, std::memory_order_relaxed);
        aborts_by_reason_[static_cast<size_t>(reason)].fetch_add(1, std::memory_order_relaxed);
    }

    void dropped()
    {
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
    }

    Snapshot snapshot() const
    {
        Snapshot result;
        result.start_time = start_time_;
        result.uptime = std::chrono::duration<double>(uptime_clock_t::now() - started_).count();
        result.samples = samples_.load(std::memory_order_relaxed);
        result.blocks = blocks_.load(std::memory_order_relaxed);
        result.observations = observations_.load(std::memory_order_relaxed);
        result.tone_observations = tone_observations_.load(std::memory_order_relaxed);
        for (size_t i = 0; i != tone_count; ++i)
        {
            result.symbol_counts[i] = symbol_counts_[i].load(std::memory_order_relaxed);
        }
        result.sequences_completed = sequences_completed_.load(std::memory_order_relaxed);
        result.sequences_aborted = sequences_aborted_.load(std::memory_order_relaxed);
        for (size_t i = 0; i != abort_reason_count; ++i)
        {
            result.aborts_by_reason[i] = aborts_by_reason_[i].load(std::memory_order_relaxed);
        }
        result.records_dropped = records_dropped_.load(std::memory_order_relaxed);
        result.max_block_us = max_block_us_.load(std::memory_order_relaxed);
        return result;
    }

private:
    const clock_t::time_point start_time_;
    const uptime_clock_t::time_point started_;
    std::atomic<uint64_t> samples_{0};
    std::atomic<uint64_t> blocks_{0};
    std::atomic<uint64_t> observations_{0};
    std::atomic<uint64_t> tone_observations_{0};
    std::array<std::atomic<uint64_t>, tone_count> symbol_counts_;
    std::atomic<uint64_t> sequences_completed_{0};
    std::atomic<uint64_t> sequences_aborted_{0};
    std::array<std::atomic<uint64_t>, abort_reason_count> aborts_by_reason_;
    std::atomic<uint64_t> records_dropped_{0};
    std::atomic<uint64_t> max_block_us_{0};
};

} // zvei
