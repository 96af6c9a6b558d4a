// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <string>

#include "entropy/random_entropy.hpp"
#include "log.hpp"

namespace ccv {

random_entropy::random_entropy(std::size_t bytes) : buffer_entropy(draw(bytes))
{
    CCV_DEBUG("Drew {} random digits from {} bytes", digits_.size(), bytes);
}

std::string random_entropy::draw(std::size_t bytes)
{
    static constexpr auto hex_chars = std::array<char, 17>{"0123456789abcdef"};

    std::random_device rd;
    std::uniform_int_distribution<unsigned> dist{0, UINT8_MAX};

    std::string digits;
    digits.reserve(bytes * 2);
    for (std::size_t i = 0; i < bytes; ++i) {
        auto byte = static_cast<uint8_t>(dist(rd));
        for (auto nibble : {byte >> 4, byte & 0x0F}) {
            // Alphabetic characters of the hex encoding are discarded
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            if (nibble < 10) {
                digits.push_back(hex_chars[nibble]);
            }
        }
    }
    return digits;
}

} // namespace ccv
