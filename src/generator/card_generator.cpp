// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "exception.hpp"
#include "generator/card_generator.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace ccv::generator {

bool card_generator::repair(std::string &sequence)
{
    state_ = generator_state::repairing;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    for (unsigned d = 0; d < 10; ++d) {
        sequence.push_back(from_digit(d));
        if (checksum_.validate(sequence)) {
            state_ = generator_state::accepted;
            return true;
        }
        sequence.pop_back();
    }
    return false;
}

std::string card_generator::generate(std::string_view prefix, std::size_t target_length)
{
    if (prefix.empty() || prefix.size() >= target_length) {
        throw std::length_error("prefix doesn't fit within the target length");
    }

    std::string sequence{prefix};
    sequence.reserve(target_length);

    while (sequence.size() < target_length - 1) {
        state_ = generator_state::seeding;
        try {
            sequence.push_back(entropy_.next_digit());
        } catch (const entropy_exhausted &) {
            state_ = generator_state::exhausted;
            CCV_WARN("Entropy exhausted after {} of {} digits", sequence.size(), target_length);
            throw;
        }

        // The trial check digit only confirms the extended sequence can be
        // completed, it's dropped before the next random digit.
        if (!repair(sequence)) {
            throw std::logic_error("no check digit satisfies the checksum");
        }
        sequence.pop_back();
    }

    if (!repair(sequence)) {
        throw std::logic_error("no check digit satisfies the checksum");
    }

    state_ = generator_state::done;
    CCV_DEBUG("Generated {} digits from prefix {}", sequence.size(), prefix);
    return sequence;
}

} // namespace ccv::generator
