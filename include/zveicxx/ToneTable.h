// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Numerology.h"

#include <array>
#include <cstdint>
#include <optional>

namespace zvei
{

/**
 * One of the sixteen ZVEI/CCIR tone digits. The underlying value is the
 * hexadecimal digit and indexes the tone table.
 */
enum class ToneSymbol : uint8_t
{
    D0, D1, D2, D3, D4, D5, D6, D7, D8, D9, DA, DB, DC, DD, DE, DF
};

struct ToneEntry
{
    char digit;
    int frequency;  // Hz
};

/**
 * ZVEI-1 tone table, indexed by symbol value.
 *
 * Sorted by frequency: F 680, B 810, D 885, C 970, 1 1060, 2 1160,
 * 3 1270, 4 1400, 5 1530, 6 1670, 7 1830, 8 2000, 9 2200, 0 2400,
 * E 2600, A 2800.
 */
constexpr std::array<ToneEntry, tone_count> tone_table = {{
    {'0', 2400}, {'1', 1060}, {'2', 1160}, {'3', 1270},
    {'4', 1400}, {'5', 1530}, {'6', 1670}, {'7', 1830},
    {'8', 2000}, {'9', 2200}, {'A', 2800}, {'B', 810},
    {'C', 970},  {'D', 885},  {'E', 2600}, {'F', 680}
}};

constexpr size_t index_of(ToneSymbol symbol)
{
    return static_cast<size_t>(symbol);
}

constexpr ToneSymbol symbol_at(size_t index)
{
    return static_cast<ToneSymbol>(index);
}

constexpr int frequency_of(ToneSymbol symbol)
{
    return tone_table[index_of(symbol)].frequency;
}

constexpr char to_char(ToneSymbol symbol)
{
    return tone_table[index_of(symbol)].digit;
}

/// Reverse lookup of an exact table frequency.
inline std::optional<ToneSymbol> symbol_for_frequency(int frequency)
{
    for (size_t i = 0; i != tone_table.size(); ++i)
    {
        if (tone_table[i].frequency == frequency) return symbol_at(i);
    }
    return std::nullopt;
}

/// Accepts 0-9, A-F and a-f.
inline std::optional<ToneSymbol> symbol_for_char(char c)
{
    if (c >= '0' && c <= '9') return symbol_at(c - '0');
    if (c >= 'A' && c <= 'F') return symbol_at(c - 'A' + 10);
    if (c >= 'a' && c <= 'f') return symbol_at(c - 'a' + 10);
    return std::nullopt;
}

namespace detail
{

constexpr bool tone_table_is_bijective()
{
    for (size_t i = 0; i != tone_table.size(); ++i)
    {
        for (size_t j = i + 1; j != tone_table.size(); ++j)
        {
            if (tone_table[i].frequency == tone_table[j].frequency) return false;
            if (tone_table[i].digit == tone_table[j].digit) return false;
        }
    }
    return true;
}

constexpr int min_table_spacing()
{
    int result = max_tone_hz;
    for (size_t i = 0; i != tone_table.size(); ++i)
    {
        for (size_t j = i + 1; j != tone_table.size(); ++j)
        {
            int d = tone_table[i].frequency - tone_table[j].frequency;
            if (d < 0) d = -d;
            if (d < result) result = d;
        }
    }
    return result;
}

} // detail

static_assert(detail::tone_table_is_bijective(), "Tone table must be a bijection");
static_assert(detail::min_table_spacing() == min_tone_spacing_hz,
              "Tone spacing constant does not match the table");

} // zvei
