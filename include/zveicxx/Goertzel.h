// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cmath>
#include <cstddef>

namespace zvei
{

/**
 * Single-frequency DFT estimator (Goertzel recurrence).
 *
 * The target frequency need not fall on a DFT bin; the coefficient is
 * computed from the exact frequency, so the result is the DTFT magnitude
 * at that frequency over the window.
 *
 *   s[n] = x[n] + 2cos(w) s[n-1] - s[n-2]
 *   |X|^2 = s1^2 + s2^2 - 2cos(w) s1 s2
 */
template <typename FloatType>
class Goertzel
{
public:
    static constexpr double PI = 3.14159265358979323846;

    Goertzel() = default;

    Goertzel(double frequency, double sample_rate)
    : coeff_(2.0 * std::cos(2.0 * PI * frequency / sample_rate))
    {}

    /**
     * Squared magnitude of the window at the target frequency, with the
     * constant `offset` subtracted from every sample.
     */
    FloatType power(const FloatType* samples, size_t count, FloatType offset = 0) const
    {
        FloatType s1 = 0;
        FloatType s2 = 0;
        const FloatType coeff = coeff_;

        for (size_t i = 0; i != count; ++i)
        {
            FloatType s0 = (samples[i] - offset) + coeff * s1 - s2;
            s2 = s1;
            s1 = s0;
        }

        FloatType p = s1 * s1 + s2 * s2 - coeff * s1 * s2;
        return p < 0 ? 0 : p;   // rounding can go slightly negative
    }

    /**
     * Power normalized so that a sinusoid of amplitude A at the target
     * frequency yields A^2.
     */
    FloatType energy(const FloatType* samples, size_t count, FloatType offset = 0) const
    {
        if (count == 0) return 0;
        FloatType scale = FloatType(2) / count;
        return power(samples, count, offset) * scale * scale;
    }

private:
    FloatType coeff_ = 0;
};

} // zvei
