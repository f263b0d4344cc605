// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>

namespace zvei
{
    // =========================================================================
    // PROTOCOL
    // =========================================================================

    const size_t code_digits = 5;           // digits in one ZVEI/CCIR sequence
    const size_t tone_count = 16;           // size of the tone alphabet
    const int nominal_tone_ms = 70;         // ZVEI-1 tone length
    const int min_tone_spacing_hz = 75;     // B (810 Hz) to D (885 Hz)
    const int max_tone_hz = 2800;           // A

    // =========================================================================
    // RECEIVER (RTL-SDR)
    // =========================================================================

    const uint32_t default_frequency = 170000000;   // Hz
    const uint32_t default_sample_rate = 250000;    // complex samples per second
    const uint32_t min_frequency = 24000000;        // R820T tuning range
    const uint32_t max_frequency = 1766000000;
    const double max_gain_db = 50.0;

    // rtl_sdr rejects rates between these two bands
    const uint32_t min_sample_rate_low = 225001;
    const uint32_t max_sample_rate_low = 300000;
    const uint32_t min_sample_rate_high = 900001;
    const uint32_t max_sample_rate_high = 3200000;

    // =========================================================================
    // DECODER DEFAULTS
    // =========================================================================

    const uint32_t default_audio_rate = 25000;      // Hz after decimation
    const double default_fm_deviation = 5000.0;     // Hz, maps to audio amplitude 1.0
    const double default_detection_window = 0.010;  // seconds per analysis window
    const double default_detection_threshold = 0.02;
    const double default_discrimination_margin_db = 6.0;
    const double default_repeat_suppression_window = 0.040;
    const double default_max_inter_digit_gap = 0.060;
    const double default_silence_timeout = 0.100;
    const double default_status_interval = 60.0;

    const double audio_clip_level = 2.0;

    // Shortest analysis window that separates the two closest tones. At
    // 0.75 / spacing the neighbour leaks in at sinc(0.75)^2, about -10 dB,
    // which clears the default discrimination margin.
    const double min_detection_window = 0.75 / min_tone_spacing_hz;

    static_assert(2 * max_tone_hz < default_audio_rate,
                  "Audio rate must exceed twice the highest tone");
    static_assert(default_sample_rate % default_audio_rate == 0,
                  "Decimation factor must be an integer");

    // =========================================================================
    // SINKS
    // =========================================================================

    const size_t default_queue_depth = 64;          // records buffered for sinks
    const size_t console_queue_depth = 256;         // console lines buffered
}
