// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#include "DecoderConfig.h"
#include "Goertzel.h"
#include "ToneDetector.h"

#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <vector>

using namespace zvei;

namespace {

const double PI = 3.14159265358979323846;

std::vector<float> sine(double frequency, double amplitude, size_t n, double rate = default_audio_rate,
    double offset = 0)
{
    std::vector<float> result(n);
    for (size_t i = 0; i != n; ++i)
    {
        result[i] = float(offset + amplitude * std::sin(2 * PI * frequency * i / rate + 0.3));
    }
    return result;
}

void add(std::vector<float>& a, const std::vector<float>& b)
{
    for (size_t i = 0; i != a.size(); ++i) a[i] += b[i];
}

} // namespace

TEST(Goertzel, EnergyOfOnBinSine)
{
    // 1000 Hz over 250 samples at 25 kHz is exactly ten cycles.
    Goertzel<float> g(1000, 25000);
    auto x = sine(1000, 0.5, 250);
    EXPECT_NEAR(g.energy(x.data(), x.size()), 0.25, 0.005);
}

TEST(Goertzel, OffsetRemovesDc)
{
    Goertzel<float> g(1060, 25000);
    auto x = sine(1060, 0.4, 250, 25000, 0.7);
    float with_dc = g.energy(x.data(), x.size());
    float without = g.energy(x.data(), x.size(), 0.7f);
    EXPECT_NEAR(without, 0.16, 0.01);
    EXPECT_GT(std::abs(with_dc - without), 0.0f);
}

TEST(Goertzel, EmptyWindow)
{
    Goertzel<float> g(1000, 25000);
    float x = 1;
    EXPECT_EQ(g.energy(&x, 0), 0.0f);
}

TEST(ToneDetector, WindowFromConfig)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);
    EXPECT_EQ(detector.window(), 250u);
}

TEST(ToneDetector, DetectsEverySymbol)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    for (size_t i = 0; i != tone_count; ++i)
    {
        auto symbol = symbol_at(i);
        auto audio = sine(frequency_of(symbol), 0.6, detector.window());
        auto obs = detector(audio, 1.5);

        ASSERT_TRUE(obs.symbol.has_value()) << "tone " << to_char(symbol);
        EXPECT_EQ(*obs.symbol, symbol) << "tone " << to_char(symbol);
        EXPECT_NEAR(obs.energy, 0.36, 0.05);
        EXPECT_GT(obs.confidence, 0.7f);
        EXPECT_LE(obs.confidence, 1.0f);
        EXPECT_DOUBLE_EQ(obs.timestamp, 1.5);
        EXPECT_DOUBLE_EQ(obs.duration, 0.010);
    }
}

TEST(ToneDetector, DcOffsetDoesNotMatter)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    auto audio = sine(frequency_of(ToneSymbol::DF), 0.5, detector.window(), default_audio_rate, 0.3);
    auto obs = detector(audio, 0);
    ASSERT_TRUE(obs.symbol.has_value());
    EXPECT_EQ(*obs.symbol, ToneSymbol::DF);
}

TEST(ToneDetector, SilenceIsNoTone)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    std::vector<float> audio(detector.window(), 0.0f);
    auto obs = detector(audio, 0);
    EXPECT_FALSE(obs.symbol.has_value());
    EXPECT_EQ(obs.energy, 0.0f);
    EXPECT_EQ(obs.confidence, 0.0f);
}

TEST(ToneDetector, WeakToneBelowThreshold)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    // amplitude 0.1 -> energy 0.01, under the 0.02 default threshold
    auto audio = sine(frequency_of(ToneSymbol::D4), 0.1, detector.window());
    auto obs = detector(audio, 0);
    EXPECT_FALSE(obs.symbol.has_value());
    EXPECT_GT(obs.energy, 0.005f);
}

TEST(ToneDetector, LowerThresholdAcceptsWeakTone)
{
    DecoderConfig config;
    config.detection_threshold = 0.005;
    ToneDetector<float> detector(config);

    auto audio = sine(frequency_of(ToneSymbol::D4), 0.1, detector.window());
    auto obs = detector(audio, 0);
    ASSERT_TRUE(obs.symbol.has_value());
    EXPECT_EQ(*obs.symbol, ToneSymbol::D4);
}

TEST(ToneDetector, TwoEqualTonesAreAmbiguous)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    auto audio = sine(frequency_of(ToneSymbol::D2), 0.4, detector.window());
    add(audio, sine(frequency_of(ToneSymbol::D7), 0.4, detector.window()));
    auto obs = detector(audio, 0);

    EXPECT_FALSE(obs.symbol.has_value());
    EXPECT_GT(obs.energy, float(config.detection_threshold));
}

TEST(ToneDetector, DominantToneWinsOverWeakInterferer)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    auto audio = sine(frequency_of(ToneSymbol::D2), 0.6, detector.window());
    add(audio, sine(frequency_of(ToneSymbol::D7), 0.15, detector.window()));
    auto obs = detector(audio, 0);

    ASSERT_TRUE(obs.symbol.has_value());
    EXPECT_EQ(*obs.symbol, ToneSymbol::D2);
}

TEST(ToneDetector, ClosestTonesAreSeparated)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    auto b = detector(sine(frequency_of(ToneSymbol::DB), 0.5, detector.window()), 0);
    auto d = detector(sine(frequency_of(ToneSymbol::DD), 0.5, detector.window()), 0);

    ASSERT_TRUE(b.symbol.has_value());
    ASSERT_TRUE(d.symbol.has_value());
    EXPECT_EQ(*b.symbol, ToneSymbol::DB);
    EXPECT_EQ(*d.symbol, ToneSymbol::DD);
    EXPECT_GT(detector.energies()[index_of(ToneSymbol::DD)],
        4 * detector.energies()[index_of(ToneSymbol::DB)]);
}

TEST(ToneDetector, WhiteNoiseIsRejected)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);

    std::mt19937 rng(7);
    std::normal_distribution<float> noise(0.0f, 0.05f);
    std::vector<float> audio(detector.window());
    for (auto& x : audio) x = noise(rng);

    auto obs = detector(audio, 0);
    EXPECT_FALSE(obs.symbol.has_value());
}

TEST(ToneDetector, EmptyWindow)
{
    DecoderConfig config;
    ToneDetector<float> detector(config);
    auto obs = detector(nullptr, 0, 2.0);
    EXPECT_FALSE(obs.symbol.has_value());
    EXPECT_DOUBLE_EQ(obs.timestamp, 2.0);
}
