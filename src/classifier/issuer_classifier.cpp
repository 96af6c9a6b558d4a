// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string_view>

#include "classifier/issuer.hpp"
#include "classifier/issuer_classifier.hpp"
#include "classifier/major_industry.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace ccv {

classification issuer_classifier::classify(std::string_view sequence) const
{
    if (sequence.empty()) {
        throw invalid_input("empty card number");
    }

    auto industry = major_industry_from_digit(sequence.front());
    if (!industry.has_value()) {
        throw unknown_major_industry(sequence.front());
    }

    return {find_issuer(sequence), *industry};
}

std::optional<issuer_id> issuer_classifier::find_issuer(std::string_view sequence) noexcept
{
    const auto table = issuer_table();
    for (std::size_t length = 1; length <= sequence.size(); ++length) {
        const auto prefix = sequence.substr(0, length);
        for (const auto &entry : table) {
            for (const auto &range : entry.ranges) {
                if (range.contains(prefix)) {
                    CCV_TRACE("Prefix {} matched issuer {}", prefix, issuer_to_string(entry.id));
                    return entry.id;
                }
            }
        }
    }

    CCV_TRACE("No issuer found for {}", sequence);
    return std::nullopt;
}

} // namespace ccv
