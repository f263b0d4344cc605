// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// FM discriminator
//
// Instantaneous frequency from the phase step between consecutive complex
// samples: f[n] = arg(s[n] * conj(s[n-1])) * Fs / 2pi

#pragma once

#include "Numerology.h"

#include <cmath>
#include <complex>
#include <vector>

namespace zvei {

template <typename FloatType>
struct FmDemodulator
{
    using sample_t = std::complex<FloatType>;
    using block_t = std::vector<sample_t>;
    using audio_t = std::vector<FloatType>;

    static constexpr FloatType PI = 3.14159265358979323846;

    FloatType gain_;        // radians per sample -> audio amplitude
    FloatType clip_;

    /**
     * @param sample_rate - complex sample rate in Hz
     * @param deviation - frequency deviation (Hz) that maps to amplitude 1.0
     */
    FmDemodulator(FloatType sample_rate, FloatType deviation,
        FloatType clip = audio_clip_level)
    : gain_(sample_rate / (2 * PI * deviation))
    , clip_(clip)
    {}

    /**
     * Demodulate one block.
     *
     * @param block - complex input samples
     * @param prev - last sample of the previous block (0 at stream start)
     * @param audio - receives one audio sample per input sample
     * @return the last sample of this block, to pass in with the next one
     */
    sample_t operator()(const block_t& block, sample_t prev, audio_t& audio) const
    {
        audio.resize(block.size());

        for (size_t i = 0; i != block.size(); ++i)
        {
            sample_t s = block[i];
            if (!std::isfinite(s.real()) || !std::isfinite(s.imag()))
            {
                // Keep the previous sample as the phase reference.
                audio[i] = 0;
                continue;
            }

            auto product = s * std::conj(prev);
            FloatType value = 0;
            if (product.real() != 0 || product.imag() != 0)
            {
                value = std::arg(product) * gain_;
            }

            if (value > clip_) value = clip_;
            else if (value < -clip_) value = -clip_;

            audio[i] = value;
            prev = s;
        }

        return prev;
    }
};

} // namespace zvei
