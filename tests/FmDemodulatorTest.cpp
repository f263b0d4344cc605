// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Decimator.h"
#include "FmDemodulator.h"
#include "ToneModulator.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace zvei;

namespace {

const double PI = 3.14159265358979323846;

FmDemodulator<float>::block_t offset_carrier(double offset, double rate, size_t n, double phase = 0)
{
    FmDemodulator<float>::block_t result;
    for (size_t i = 0; i != n; ++i)
    {
        double p = phase + 2 * PI * offset * i / rate;
        result.emplace_back(float(std::cos(p)), float(std::sin(p)));
    }
    return result;
}

} // namespace

TEST(FmDemodulator, ConstantOffset)
{
    FmDemodulator<float> demod(250000, 5000);
    auto block = offset_carrier(2500, 250000, 1000);

    std::vector<float> audio;
    demod(block, block[0], audio);

    ASSERT_EQ(audio.size(), block.size());
    for (size_t i = 1; i != audio.size(); ++i)
    {
        EXPECT_NEAR(audio[i], 0.5, 1e-3);
    }
}

TEST(FmDemodulator, NegativeOffset)
{
    FmDemodulator<float> demod(250000, 5000);
    auto block = offset_carrier(-1000, 250000, 100);

    std::vector<float> audio;
    demod(block, block[0], audio);
    EXPECT_NEAR(audio.back(), -0.2, 1e-3);
}

TEST(FmDemodulator, BlockSplitMatchesSingleBlock)
{
    FmDemodulator<float> demod(250000, 5000);
    ToneModulator<float> mod(250000, 3000);
    ToneModulator<float>::block_t signal;
    mod.tone(1400.0, 0.01, signal);

    std::vector<float> whole;
    demod(signal, {0, 0}, whole);

    FmDemodulator<float>::block_t first(signal.begin(), signal.begin() + 1234);
    FmDemodulator<float>::block_t second(signal.begin() + 1234, signal.end());
    std::vector<float> a, b;
    auto prev = demod(first, {0, 0}, a);
    demod(second, prev, b);

    ASSERT_EQ(a.size() + b.size(), whole.size());
    for (size_t i = 0; i != a.size(); ++i) EXPECT_EQ(a[i], whole[i]);
    for (size_t i = 0; i != b.size(); ++i) EXPECT_EQ(b[i], whole[a.size() + i]);
}

TEST(FmDemodulator, OutputIsClipped)
{
    // Half the sample rate away from the carrier is far beyond any deviation.
    FmDemodulator<float> demod(250000, 5000);
    auto block = offset_carrier(100000, 250000, 100);

    std::vector<float> audio;
    demod(block, block[0], audio);
    for (size_t i = 1; i != audio.size(); ++i)
    {
        EXPECT_LE(std::abs(audio[i]), audio_clip_level);
    }
    EXPECT_FLOAT_EQ(audio.back(), float(audio_clip_level));
}

TEST(FmDemodulator, ZeroAndNonFiniteSamples)
{
    FmDemodulator<float> demod(250000, 5000);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    FmDemodulator<float>::block_t block = {
        {1, 0}, {0, 0}, {nan, 0}, {0, inf}, {1, 0}
    };

    std::vector<float> audio;
    auto last = demod(block, {1, 0}, audio);

    ASSERT_EQ(audio.size(), 5u);
    for (auto x : audio)
    {
        EXPECT_TRUE(std::isfinite(x));
        EXPECT_EQ(x, 0.0f);
    }
    EXPECT_EQ(last, FmDemodulator<float>::sample_t(1, 0));
}

TEST(Decimator, AveragesAcrossCalls)
{
    Decimator<float> decimate(4);
    std::vector<float> out;

    decimate({1, 1, 1}, out);
    EXPECT_TRUE(out.empty());
    decimate({1, 3, 3, 3, 3, 5}, out);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[1], 3.0f);

    decimate.reset();
    decimate({2, 2, 2, 2}, out);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[2], 2.0f);
}
