// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <vector>

namespace zvei
{

/**
 * Integrate-and-dump decimator. Averages each run of `factor` input
 * samples into one output sample; a partial run is carried into the next
 * call so input blocks need not be a multiple of the factor.
 */
template <typename FloatType>
class Decimator
{
public:
    explicit Decimator(size_t factor)
    : factor_(factor ? factor : 1)
    {}

    /// Appends the decimated samples to `output`.
    void operator()(const std::vector<FloatType>& input, std::vector<FloatType>& output)
    {
        for (auto x : input)
        {
            sum_ += x;
            if (++count_ == factor_)
            {
                output.push_back(sum_ / factor_);
                sum_ = 0;
                count_ = 0;
            }
        }
    }

    void reset()
    {
        sum_ = 0;
        count_ = 0;
    }

    size_t factor() const { return factor_; }

private:
    size_t factor_;
    size_t count_ = 0;
    FloatType sum_ = 0;
};

} // zvei
