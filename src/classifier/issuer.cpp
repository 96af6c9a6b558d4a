// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "classifier/issuer.hpp"
#include "utils.hpp"

namespace ccv {

namespace {

constexpr std::size_t count_digits(uint32_t value)
{
    std::size_t count = 1;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    while (value >= 10) {
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        value /= 10;
        ++count;
    }
    return count;
}

constexpr prefix_range range(uint32_t lower, uint32_t upper)
{
    return {lower, upper, count_digits(lower)};
}

constexpr prefix_range single(uint32_t value) { return range(value, value); }

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
constexpr std::array diners_club_ranges{single(30)};
constexpr std::array american_express_ranges{single(34), single(37)};
constexpr std::array jcb_ranges{single(35)};
constexpr std::array aaa_ranges{single(620)};
constexpr std::array discover_ranges{single(6011), single(64), single(65),
    range(622126, 622924), range(624000, 626998), range(628200, 628898)};
constexpr std::array mastercard_ranges{
    range(2221, 2719), single(51), single(52), single(53), single(55)};
constexpr std::array visa_ranges{single(4)};
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

constexpr std::array<issuer_entry, 7> issuers{{
    {issuer_id::diners_club, diners_club_ranges},
    {issuer_id::american_express, american_express_ranges},
    {issuer_id::jcb, jcb_ranges},
    {issuer_id::aaa, aaa_ranges},
    {issuer_id::discover, discover_ranges},
    {issuer_id::mastercard, mastercard_ranges},
    {issuer_id::visa, visa_ranges},
}};

} // namespace

std::string_view issuer_to_string(issuer_id id)
{
    switch (id) {
    case issuer_id::diners_club:
        return "Diners Club";
    case issuer_id::american_express:
        return "American Express";
    case issuer_id::jcb:
        return "JCB";
    case issuer_id::aaa:
        return "AAA";
    case issuer_id::discover:
        return "Discover";
    case issuer_id::mastercard:
        return "Mastercard";
    case issuer_id::visa:
        return "Visa";
    }
    return "";
}

std::optional<issuer_id> issuer_from_string(std::string_view str)
{
    for (const auto &entry : issuers) {
        if (issuer_to_string(entry.id) == str) {
            return entry.id;
        }
    }
    return std::nullopt;
}

bool prefix_range::contains(std::string_view prefix) const noexcept
{
    if (prefix.size() != length) {
        return false;
    }

    uint32_t value = 0;
    for (auto c : prefix) {
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        value = value * 10 + to_digit(c);
    }

    return value >= lower && value <= upper;
}

std::span<const issuer_entry> issuer_table() { return issuers; }

} // namespace ccv
