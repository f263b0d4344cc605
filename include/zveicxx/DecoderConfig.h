// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Numerology.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

namespace zvei
{

/**
 * Immutable parameters of the decoding pipeline. Durations are seconds of
 * stream time.
 */
struct DecoderConfig
{
    uint32_t sample_rate = default_sample_rate;
    uint32_t audio_rate = default_audio_rate;
    double fm_deviation = default_fm_deviation;
    double detection_window = default_detection_window;
    double detection_threshold = default_detection_threshold;
    double discrimination_margin = default_discrimination_margin_db;    // dB
    double repeat_suppression_window = default_repeat_suppression_window;
    double max_inter_digit_gap = default_max_inter_digit_gap;
    double silence_timeout = default_silence_timeout;
    double status_interval = default_status_interval;

    size_t decimation() const
    {
        return sample_rate / audio_rate;
    }

    /// Audio samples per analysis window.
    size_t window_samples() const
    {
        return static_cast<size_t>(std::lround(detection_window * audio_rate));
    }

    /// Exact window length after rounding to whole audio samples.
    double window_duration() const
    {
        return double(window_samples()) / audio_rate;
    }

    double margin_ratio() const
    {
        return std::pow(10.0, discrimination_margin / 10.0);
    }

    /**
     * Throws std::invalid_argument naming the first bad parameter.
     */
    void validate() const
    {
        auto fail = [](const std::string& what, double value) {
            std::ostringstream msg;
            msg << "invalid " << what << ": " << value;
            throw std::invalid_argument(msg.str());
        };

        if (sample_rate == 0) fail("sample_rate", sample_rate);
        if (audio_rate == 0 || audio_rate > sample_rate) fail("audio_rate", audio_rate);
        if (sample_rate % audio_rate != 0)
        {
            throw std::invalid_argument("sample_rate must be a multiple of audio_rate");
        }
        if (audio_rate <= 2u * max_tone_hz) fail("audio_rate", audio_rate);
        if (!(fm_deviation > 0.0)) fail("fm_deviation", fm_deviation);
        // Tolerate the rounding of 10 ms being written as 0.01.
        if (!(detection_window >= min_detection_window * 0.999)) fail("detection_window", detection_window);
        if (!(detection_threshold > 0.0)) fail("detection_threshold", detection_threshold);
        if (!(discrimination_margin >= 0.0)) fail("discrimination_margin", discrimination_margin);
        if (!(repeat_suppression_window > 0.0)) fail("repeat_suppression_window", repeat_suppression_window);
        if (!(max_inter_digit_gap > 0.0)) fail("max_inter_digit_gap", max_inter_digit_gap);
        if (!(silence_timeout > 0.0)) fail("silence_timeout", silence_timeout);
        if (!(status_interval > 0.0)) fail("status_interval", status_interval);

        // A repeat inside the suppression window must not also count as a
        // gap, and a sequence must outlive its inter-digit gap.
        if (!(repeat_suppression_window < max_inter_digit_gap))
        {
            throw std::invalid_argument("repeat_suppression_window must be shorter than max_inter_digit_gap");
        }
        if (!(max_inter_digit_gap <= silence_timeout))
        {
            throw std::invalid_argument("silence_timeout must not be shorter than max_inter_digit_gap");
        }
    }
};

} // zvei
