// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace ccv {

// Declaration order is the classification order
enum class issuer_id : uint8_t {
    diners_club,
    american_express,
    jcb,
    aaa,
    discover,
    mastercard,
    visa,
};

std::string_view issuer_to_string(issuer_id id);
std::optional<issuer_id> issuer_from_string(std::string_view str);

// Inclusive range of numeric prefixes sharing the same number of digits
struct prefix_range {
    uint32_t lower;
    uint32_t upper;
    std::size_t length;

    // The prefix must only contain digits
    [[nodiscard]] bool contains(std::string_view prefix) const noexcept;
};

struct issuer_entry {
    issuer_id id;
    std::span<const prefix_range> ranges;
};

std::span<const issuer_entry> issuer_table();

} // namespace ccv
