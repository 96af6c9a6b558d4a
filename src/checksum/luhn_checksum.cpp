// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "utils.hpp"

namespace ccv {

char luhn_checksum::compute(std::string_view str) const noexcept
{
    // Precomputed doubled values
    //   for num from 0 to 9: 2 * num, minus 9 when above 9
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    // The rightmost digit, adjacent to the check position, is doubled
    uint32_t sum = 0;
    bool should_double = true;
    for (std::size_t i = str.size(); i > 0; --i) {
        const auto d = to_digit(str[i - 1]);
        sum += should_double ? lut[d] : d;
        should_double = !should_double;
    }

    // The last digit of 9 * sum is (10 - sum % 10) % 10
    return from_digit((sum * 9) % 10);
}

bool luhn_checksum::validate(std::string_view str) const noexcept
{
    if (!is_digit_sequence(str)) {
        return false;
    }

    return compute(str.substr(0, str.size() - 1)) == str.back();
}

} // namespace ccv
