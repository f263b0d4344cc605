// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Pipeline coordinator
//
//   SampleSource -> FmDemodulator -> Decimator -> ToneDetector
//     -> SequenceDecoder -> (Statistics, record callback)
//
// Everything after the source runs on the thread that calls run(), one
// block at a time, so observations reach the decoder in arrival order.

#pragma once

#include "Decimator.h"
#include "DecoderConfig.h"
#include "FmDemodulator.h"
#include "SampleSource.h"
#include "SequenceDecoder.h"
#include "Statistics.h"
#include "ToneDetector.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <vector>

namespace zvei
{

template <typename FloatType>
class Pipeline
{
public:
    enum class Status { SHUTDOWN, END_OF_STREAM, ACQUISITION_FAULT };

    struct RunResult
    {
        Status status = Status::END_OF_STREAM;
        std::string message;    // fault description
    };

    using record_callback_t = SequenceDecoder::record_callback_t;
    using abort_callback_t = SequenceDecoder::abort_callback_t;
    using status_callback_t = std::function<void(const Statistics::Snapshot&)>;
    using diagnostic_callback_t = std::function<void(const ToneObservation&, SequenceDecoder::DecodeResult)>;

    /**
     * @throws std::invalid_argument if the configuration is invalid; no
     *  sample has been pulled at that point.
     */
    Pipeline(const DecoderConfig& config, SampleSource& source, Statistics& stats,
        record_callback_t record_callback)
    : config_(validated(config))
    , source_(source)
    , stats_(stats)
    , record_callback_(record_callback)
    , demodulator_(config_.sample_rate, config_.fm_deviation)
    , decimator_(config_.decimation())
    , detector_(config_)
    , decoder_(config_,
        [this](const SequenceRecord& record) { on_record(record); },
        [this](AbortReason reason, size_t digits) { on_abort(reason, digits); })
    {
        status_every_ = static_cast<uint64_t>(config_.status_interval / config_.window_duration());
        if (status_every_ == 0) status_every_ = 1;
    }

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// Periodic statistics, every status_interval of stream time and once
    /// more after the final drain.
    void status(status_callback_t callback)
    {
        status_callback_ = callback;
    }

    void aborts(abort_callback_t callback)
    {
        abort_callback_ = callback;
    }

    /// Every observation and what the decoder did with it.
    void diagnostics(diagnostic_callback_t callback)
    {
        diagnostic_callback_ = callback;
    }

    /// Request shutdown. Safe to call from a signal handler or another
    /// thread; takes effect before the next block is pulled, and a source
    /// blocked waiting for samples is cancelled.
    void stop()
    {
        stop_requested_.store(true);
        source_.cancel();
    }

    bool stopping() const { return stop_requested_.load(); }

    const DecoderConfig& config() const { return config_; }
    const SequenceDecoder& decoder() const { return decoder_; }

    /// Stream time of the next analysis window.
    double stream_time() const
    {
        return double(window_index_) * detector_.window() / config_.audio_rate;
    }

    /**
     * Pull and process blocks until stopped, end of stream or fault, then
     * drain: a partial sequence is aborted (never emitted) and the final
     * statistics are published.
     */
    RunResult run()
    {
        RunResult result;
        sample_block_t block;

        while (true)
        {
            if (stop_requested_.load())
            {
                result.status = Status::SHUTDOWN;
                break;
            }

            bool more;
            try
            {
                more = source_.next_block(block);
            }
            catch (const AcquisitionError& ex)
            {
                result.status = Status::ACQUISITION_FAULT;
                result.message = ex.what();
                break;
            }

            if (!more)
            {
                result.status = stop_requested_.load() ? Status::SHUTDOWN : Status::END_OF_STREAM;
                break;
            }

            process(block);
        }

        drain();
        return result;
    }

    /// Run one block through every stage.
    void process(const sample_block_t& block)
    {
        auto started = std::chrono::steady_clock::now();

        prev_ = demodulator_(convert(block), prev_, audio_);
        decimator_(audio_, pending_);

        const size_t window = detector_.window();
        size_t offset = 0;
        while (pending_.size() - offset >= window)
        {
            auto obs = detector_(pending_.data() + offset, window, stream_time());
            offset += window;
            ++window_index_;

            stats_.observation(obs);
            auto result = decoder_(obs);
            if (diagnostic_callback_) diagnostic_callback_(obs, result);

            if (status_callback_ && window_index_ % status_every_ == 0)
            {
                status_callback_(stats_.snapshot());
            }
        }
        pending_.erase(pending_.begin(), pending_.begin() + offset);

        auto elapsed = std::chrono::steady_clock::now() - started;
        stats_.block(block.size(),
            std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    }

private:
    using demodulator_t = FmDemodulator<FloatType>;

    static DecoderConfig validated(const DecoderConfig& config)
    {
        config.validate();
        return config;
    }

    const typename demodulator_t::block_t& convert(const sample_block_t& block)
    {
        if constexpr (std::is_same<FloatType, float>::value)
        {
            return block;
        }
        else
        {
            converted_.assign(block.begin(), block.end());
            return converted_;
        }
    }

    void drain()
    {
        decoder_.abort(AbortReason::SHUTDOWN);
        if (status_callback_) status_callback_(stats_.snapshot());
    }

    void on_record(const SequenceRecord& record)
    {
        stats_.completed(record);
        if (record_callback_) record_callback_(record);
    }

    void on_abort(AbortReason reason, size_t digits)
    {
        stats_.aborted(reason);
        if (abort_callback_) abort_callback_(reason, digits);
    }

    const DecoderConfig config_;
    SampleSource& source_;
    Statistics& stats_;
    record_callback_t record_callback_;
    abort_callback_t abort_callback_;
    status_callback_t status_callback_;
    diagnostic_callback_t diagnostic_callback_;

    demodulator_t demodulator_;
    Decimator<FloatType> decimator_;
    ToneDetector<FloatType> detector_;
    SequenceDecoder decoder_;

    typename demodulator_t::sample_t prev_{0, 0};   // last sample of the previous block
    typename demodulator_t::block_t converted_;
    std::vector<FloatType> audio_;
    std::vector<FloatType> pending_;                // decimated audio not yet analysed
    uint64_t window_index_ = 0;
    uint64_t status_every_ = 1;
    std::atomic<bool> stop_requested_{false};
};

} // zvei
