// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <optional>
#include <string_view>

#include "classifier/major_industry.hpp"
#include "utils.hpp"

namespace ccv {

namespace {

constexpr std::array<std::string_view, 10> major_industries{
    "",
    "Airline industry",
    "Airline industry",
    "Travel/Entertainment",
    "Banking/Financial",
    "Banking/Financial",
    "Merchandising & Banking/Financial",
    "Petroleum industries",
    "Health, telecomm and future",
    "For assignment by standards bodies",
};

} // namespace

std::optional<std::string_view> major_industry_from_digit(char digit)
{
    if (!isdigit(digit) || digit == '0') {
        return std::nullopt;
    }
    return major_industries[to_digit(digit)];
}

} // namespace ccv
