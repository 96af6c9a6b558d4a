// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "checksum/base.hpp"
#include "entropy/base.hpp"

namespace ccv::generator {

enum class generator_state : uint8_t { seeding, repairing, accepted, exhausted, done };

// Extends a prefix with random digits up to a target length, keeping the
// sequence valid according to the checksum after every appended digit.
class card_generator {
public:
    card_generator(const base_checksum &checksum, base_entropy &entropy)
        : checksum_(checksum), entropy_(entropy)
    {}
    card_generator(const card_generator &) = delete;
    card_generator &operator=(const card_generator &) = delete;
    card_generator(card_generator &&) = delete;
    card_generator &operator=(card_generator &&) = delete;
    ~card_generator() = default;

    // The prefix must be a non-empty run of digits shorter than the target
    // length. Throws entropy_exhausted if digits run out.
    [[nodiscard]] std::string generate(std::string_view prefix, std::size_t target_length);

    [[nodiscard]] generator_state state() const noexcept { return state_; }

protected:
    // Appends the first check digit which makes the sequence valid
    bool repair(std::string &sequence);

    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    const base_checksum &checksum_;
    base_entropy &entropy_;
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)
    generator_state state_{generator_state::seeding};
};

} // namespace ccv::generator
