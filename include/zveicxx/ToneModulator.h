// Copyright 2026 Open Research Institute, Inc.
// SPDX-License-Identifier: MIT
//
// Tone sequence FM modulator
//
// Produces continuous-phase FM baseband for a sequence of audio tones, the
// way a paging transmitter sends a five-tone code.
//
// Output: Complex I/Q samples

#pragma once

#include "ToneTable.h"

#include <cmath>
#include <complex>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace zvei {

/**
 * FM modulator for audio tones
 *
 * Both the audio oscillator and the carrier phase are continuous across
 * calls, so consecutive tones join without clicks.
 *
 * Template parameters:
 *   FloatType - sample component type (default float)
 */
template <typename FloatType = float>
class ToneModulator
{
public:
    static constexpr double PI = 3.14159265358979323846;

    using sample_t = std::complex<FloatType>;
    using block_t = std::vector<sample_t>;

private:
    double sample_rate_;
    double deviation_;              // Hz peak for a full-scale audio tone
    double amplitude_ = 1.0;        // carrier magnitude
    double carrier_phase_ = 0.0;
    double audio_phase_ = 0.0;

    size_t samples_for(double seconds) const
    {
        return seconds > 0 ? static_cast<size_t>(std::lround(seconds * sample_rate_)) : 0;
    }

    void emit(block_t& output)
    {
        output.emplace_back(FloatType(amplitude_ * std::cos(carrier_phase_)),
            FloatType(amplitude_ * std::sin(carrier_phase_)));
    }

    void wrap(double& phase)
    {
        while (phase > PI) phase -= 2.0 * PI;
        while (phase < -PI) phase += 2.0 * PI;
    }

public:
    /**
     * @param sample_rate - complex samples per second
     * @param deviation - peak frequency deviation of a tone, Hz
     */
    ToneModulator(double sample_rate, double deviation)
    : sample_rate_(sample_rate)
    , deviation_(deviation)
    {}

    /**
     * Reset the modulator state
     */
    void reset()
    {
        carrier_phase_ = 0.0;
        audio_phase_ = 0.0;
    }

    /**
     * Set carrier magnitude (default 1.0)
     */
    void set_amplitude(double amp)
    {
        amplitude_ = amp;
    }

    void set_deviation(double deviation)
    {
        deviation_ = deviation;
    }

    /**
     * Append `seconds` of carrier modulated by a sine at `frequency`.
     */
    void tone(double frequency, double seconds, block_t& output)
    {
        const double audio_step = 2.0 * PI * frequency / sample_rate_;
        const double carrier_scale = 2.0 * PI * deviation_ / sample_rate_;

        size_t n = samples_for(seconds);
        output.reserve(output.size() + n);
        for (size_t i = 0; i < n; ++i)
        {
            audio_phase_ += audio_step;
            wrap(audio_phase_);
            carrier_phase_ += carrier_scale * std::sin(audio_phase_);
            wrap(carrier_phase_);
            emit(output);
        }
    }

    void tone(ToneSymbol symbol, double seconds, block_t& output)
    {
        tone(frequency_of(symbol), seconds, output);
    }

    /**
     * Append unmodulated carrier
     */
    void silence(double seconds, block_t& output)
    {
        size_t n = samples_for(seconds);
        output.reserve(output.size() + n);
        for (size_t i = 0; i < n; ++i) emit(output);
    }

    /**
     * Append a code: one tone per digit, with an optional gap of carrier
     * between digits.
     *
     * @param digits - hex digits, e.g. "12345"
     * @throws std::invalid_argument on a character outside 0-9, A-F
     */
    void code(const std::string& digits, double tone_seconds, double gap_seconds, block_t& output)
    {
        for (size_t i = 0; i != digits.size(); ++i)
        {
            auto symbol = symbol_for_char(digits[i]);
            if (!symbol) throw std::invalid_argument("not a tone digit: " + digits.substr(i, 1));
            if (i != 0) silence(gap_seconds, output);
            tone(*symbol, tone_seconds, output);
        }
    }
};

} // namespace zvei
