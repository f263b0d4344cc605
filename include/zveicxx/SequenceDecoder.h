// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Sequence decoder: assembles tone observations into five-digit codes.
//
//   IDLE --symbol--> ACCUMULATING(1) --new symbol--> ... ACCUMULATING(4)
//        --new symbol--> COMPLETE (record emitted) --> IDLE
//
// A partial sequence is aborted on prolonged silence, on a new digit that
// arrives too late, or on request (shutdown drain).

#pragma once

#include "DecoderConfig.h"
#include "ToneDetector.h"
#include "ToneTable.h"

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace zvei
{

struct SequenceRecord
{
    std::array<ToneSymbol, code_digits> digits;
    double start_time = 0;      // stream time of the first digit, seconds
    double end_time = 0;        // end of the window that completed the code
    float mean_confidence = 0;
    float mean_energy = 0;

    std::string code() const
    {
        std::string result(code_digits, ' ');
        for (size_t i = 0; i != code_digits; ++i) result[i] = to_char(digits[i]);
        return result;
    }
};

enum class AbortReason { SILENCE_TIMEOUT, GAP_EXCEEDED, SHUTDOWN };

constexpr size_t abort_reason_count = 3;

inline const char* to_string(AbortReason reason)
{
    switch (reason)
    {
    case AbortReason::SILENCE_TIMEOUT: return "silence timeout";
    case AbortReason::GAP_EXCEEDED: return "inter-digit gap exceeded";
    case AbortReason::SHUTDOWN: return "shutdown";
    }
    return "unknown";
}

class SequenceDecoder
{
public:
    enum class State { IDLE, ACCUMULATING };

    /// What a single observation did to the decoder.
    enum class DecodeResult { IGNORED, STARTED, DUPLICATE, APPENDED, COMPLETE, ABORTED };

    using record_callback_t = std::function<void(const SequenceRecord&)>;
    using abort_callback_t = std::function<void(AbortReason, size_t digits)>;

    SequenceDecoder(const DecoderConfig& config, record_callback_t record_callback,
        abort_callback_t abort_callback = abort_callback_t())
    : suppression_(config.repeat_suppression_window)
    , max_gap_(config.max_inter_digit_gap)
    , silence_timeout_(config.silence_timeout)
    , record_callback_(record_callback)
    , abort_callback_(abort_callback)
    {}

    State state() const { return state_; }

    /// Digits collected so far in the current sequence (0-4).
    size_t digits() const { return count_; }

    /// Stream time at which the most recent digit was accepted.
    double last_digit_time() const { return last_digit_time_; }

    DecodeResult operator()(const ToneObservation& obs)
    {
        if (state_ == State::IDLE) return do_idle(obs);
        return do_accumulating(obs);
    }

    /**
     * Discard a partial sequence. Returns true if one was pending. Never
     * emits a record.
     */
    bool abort(AbortReason reason)
    {
        if (state_ != State::ACCUMULATING) return false;

        size_t discarded = count_;
        reset();
        if (abort_callback_) abort_callback_(reason, discarded);
        return true;
    }

    void reset()
    {
        state_ = State::IDLE;
        count_ = 0;
        confidence_sum_ = 0;
        energy_sum_ = 0;
    }

private:
    DecodeResult do_idle(const ToneObservation& obs)
    {
        if (!obs.symbol) return DecodeResult::IGNORED;

        // The final tone of a completed code keeps sounding after the
        // record was emitted.
        if (tail_ && *obs.symbol == *tail_ && obs.timestamp - last_seen_ <= suppression_)
        {
            last_seen_ = obs.timestamp;
            return DecodeResult::DUPLICATE;
        }
        tail_.reset();

        start(obs);
        return DecodeResult::STARTED;
    }

    DecodeResult do_accumulating(const ToneObservation& obs)
    {
        double since = obs.timestamp - last_seen_;

        if (!obs.symbol)
        {
            if (since > silence_timeout_)
            {
                abort(AbortReason::SILENCE_TIMEOUT);
                return DecodeResult::ABORTED;
            }
            return DecodeResult::IGNORED;
        }

        ToneSymbol symbol = *obs.symbol;

        if (symbol == buffer_[count_ - 1] && since <= suppression_)
        {
            last_seen_ = obs.timestamp;
            return DecodeResult::DUPLICATE;
        }

        if (since > max_gap_)
        {
            // Too late to belong to this sequence; it may start the next.
            abort(AbortReason::GAP_EXCEEDED);
            start(obs);
            return DecodeResult::ABORTED;
        }

        append(obs);

        if (count_ == code_digits)
        {
            SequenceRecord record;
            record.digits = buffer_;
            record.start_time = start_time_;
            record.end_time = obs.timestamp + obs.duration;
            record.mean_confidence = float(confidence_sum_ / code_digits);
            record.mean_energy = float(energy_sum_ / code_digits);

            tail_ = symbol;
            reset();
            if (record_callback_) record_callback_(record);
            return DecodeResult::COMPLETE;
        }

        return DecodeResult::APPENDED;
    }

    void start(const ToneObservation& obs)
    {
        reset();
        state_ = State::ACCUMULATING;
        start_time_ = obs.timestamp;
        append(obs);
    }

    void append(const ToneObservation& obs)
    {
        buffer_[count_++] = *obs.symbol;
        last_digit_time_ = obs.timestamp;
        last_seen_ = obs.timestamp;
        confidence_sum_ += obs.confidence;
        energy_sum_ += obs.energy;
    }

    double suppression_;
    double max_gap_;
    double silence_timeout_;
    record_callback_t record_callback_;
    abort_callback_t abort_callback_;

    State state_ = State::IDLE;
    std::array<ToneSymbol, code_digits> buffer_;
    size_t count_ = 0;
    double start_time_ = 0;
    double last_digit_time_ = 0;    // when the last digit was accepted
    double last_seen_ = 0;          // last sighting of the last digit's tone
    double confidence_sum_ = 0;
    double energy_sum_ = 0;
    std::optional<ToneSymbol> tail_;    // final digit of the last record
};

inline const char* to_string(SequenceDecoder::DecodeResult result)
{
    switch (result)
    {
    case SequenceDecoder::DecodeResult::IGNORED: return "ignored";
    case SequenceDecoder::DecodeResult::STARTED: return "started";
    case SequenceDecoder::DecodeResult::DUPLICATE: return "duplicate";
    case SequenceDecoder::DecodeResult::APPENDED: return "appended";
    case SequenceDecoder::DecodeResult::COMPLETE: return "complete";
    case SequenceDecoder::DecodeResult::ABORTED: return "aborted";
    }
    return "unknown";
}

} // zvei
