// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace ccv {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline uint8_t to_digit(char c) { return static_cast<uint8_t>(c - '0'); }
inline char from_digit(unsigned d) { return static_cast<char>('0' + d); }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

inline bool is_digit_sequence(std::string_view str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return isdigit(c); });
}

} // namespace ccv
