// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Tone detector: one Goertzel estimator per reference tone over a fixed
// analysis window, strongest tone accepted only when it is both loud
// enough and clearly stronger than the runner-up.

#pragma once

#include "DecoderConfig.h"
#include "Goertzel.h"
#include "ToneTable.h"

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace zvei
{

struct ToneObservation
{
    std::optional<ToneSymbol> symbol;   // empty: silence, weak or ambiguous
    float energy = 0;       // normalized power of the strongest tone
    float confidence = 0;   // 1 - runner-up / best when a symbol is reported
    double timestamp = 0;   // stream time of the window start, seconds
    double duration = 0;    // window length, seconds
};

template <typename FloatType>
class ToneDetector
{
public:
    using energies_t = std::array<FloatType, tone_count>;

    ToneDetector(const DecoderConfig& config)
    : threshold_(config.detection_threshold)
    , margin_(config.margin_ratio())
    , window_(config.window_samples())
    , duration_(config.window_duration())
    {
        for (size_t i = 0; i != tone_count; ++i)
        {
            filters_[i] = Goertzel<FloatType>(tone_table[i].frequency, config.audio_rate);
        }
        energies_.fill(0);
    }

    /// Audio samples expected per call.
    size_t window() const { return window_; }

    /// Per-tone energies of the last analysed window, indexed by symbol.
    const energies_t& energies() const { return energies_; }

    /**
     * Analyse one window of audio.
     *
     * @param audio - `count` audio samples (normally window())
     * @param timestamp - stream time of the first sample
     */
    ToneObservation operator()(const FloatType* audio, size_t count, double timestamp)
    {
        ToneObservation result;
        result.timestamp = timestamp;
        result.duration = duration_;

        if (count == 0)
        {
            energies_.fill(0);
            return result;
        }

        // FM carrier offset shows up as DC; remove it before correlating.
        FloatType mean = 0;
        for (size_t i = 0; i != count; ++i) mean += audio[i];
        mean /= count;

        size_t best = 0;
        size_t second = 1;
        for (size_t i = 0; i != tone_count; ++i)
        {
            energies_[i] = filters_[i].energy(audio, count, mean);
        }
        if (energies_[second] > energies_[best]) std::swap(best, second);
        for (size_t i = 2; i != tone_count; ++i)
        {
            if (energies_[i] > energies_[best])
            {
                second = best;
                best = i;
            }
            else if (energies_[i] > energies_[second])
            {
                second = i;
            }
        }

        FloatType best_energy = energies_[best];
        FloatType second_energy = energies_[second];
        result.energy = best_energy;

        if (!(best_energy > threshold_)) return result;

        // A tie within the margin is reported as no tone rather than as
        // an arbitrary winner; this is what a window straddling two tones
        // looks like.
        if (!(best_energy > second_energy * margin_)) return result;

        result.symbol = symbol_at(best);
        result.confidence = 1.0f - float(second_energy / best_energy);
        return result;
    }

    ToneObservation operator()(const std::vector<FloatType>& audio, double timestamp)
    {
        return (*this)(audio.data(), audio.size(), timestamp);
    }

private:
    std::array<Goertzel<FloatType>, tone_count> filters_;
    energies_t energies_;
    FloatType threshold_;
    FloatType margin_;
    size_t window_;
    double duration_;
};

} // zvei
