// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Numerology.h"

#include <complex>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace zvei
{

using iq_sample_t = std::complex<float>;
using sample_block_t = std::vector<iq_sample_t>;

/**
 * Fatal receiver condition: device lost, pipe broken, spawn failed.
 */
struct AcquisitionError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * A continuous stream of complex baseband samples.
 */
class SampleSource
{
public:
    virtual ~SampleSource() {}

    /**
     * Block until the next block of samples is available.
     *
     * @param block - replaced with the next block; I and Q in [-1, 1]
     * @return false at end of stream
     * @throws AcquisitionError on a device fault
     */
    virtual bool next_block(sample_block_t& block) = 0;

    /**
     * Unblock a pending or future next_block(), which then returns false.
     * Must be async-signal-safe.
     */
    virtual void cancel() {}
};

/**
 * Tuner gain: automatic, or a fixed value in dB.
 */
struct GainSetting
{
    bool automatic = true;
    double db = 0;

    static GainSetting parse(const std::string& text)
    {
        GainSetting result;
        if (text == "auto") return result;

        std::istringstream in(text);
        double value;
        if (!(in >> value) || !in.eof())
        {
            throw std::invalid_argument("invalid gain: " + text);
        }
        result.automatic = false;
        result.db = value;
        return result;
    }

    std::string to_string() const
    {
        if (automatic) return "auto";
        std::ostringstream out;
        out << db;
        return out.str();
    }
};

/**
 * Receiver tuning parameters.
 */
struct AcquisitionConfig
{
    uint32_t frequency = default_frequency;     // Hz
    uint32_t sample_rate = default_sample_rate; // Hz
    GainSetting gain;
    int ppm = 0;
    int device_index = 0;

    void validate() const
    {
        if (frequency < min_frequency || frequency > max_frequency)
        {
            throw std::invalid_argument("frequency out of range: " + std::to_string(frequency) + " Hz");
        }

        bool low_band = sample_rate >= min_sample_rate_low && sample_rate <= max_sample_rate_low;
        bool high_band = sample_rate >= min_sample_rate_high && sample_rate <= max_sample_rate_high;
        if (!low_band && !high_band)
        {
            throw std::invalid_argument("unsupported sample rate: " + std::to_string(sample_rate) + " Hz");
        }

        if (!gain.automatic && !(gain.db >= 0.0 && gain.db <= max_gain_db))
        {
            throw std::invalid_argument("gain out of range (0-50 dB): " + gain.to_string());
        }

        if (device_index < 0)
        {
            throw std::invalid_argument("invalid device index: " + std::to_string(device_index));
        }
    }
};

} // zvei
