// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "card_variant.hpp"
#include "engine.hpp"
#include "entropy/random_entropy.hpp"
#include "exception.hpp"
#include "generator/card_generator.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace ccv {

namespace {

constexpr std::size_t personal_digits_offset = 7;

std::string extract_personal_digits(std::string_view number)
{
    if (number.size() <= personal_digits_offset + 1) {
        return {};
    }
    return std::string{number.substr(
        personal_digits_offset, number.size() - personal_digits_offset - 1)};
}

} // namespace

engine::engine(engine_config config) : config_(config) { config_.validate(); }

card_result engine::describe(std::string card_number) const
{
    auto [issuer, industry] = classifier_.classify(card_number);

    card_result result;
    result.valid = checksum_.validate(card_number);
    result.check_digit =
        checksum_.compute(std::string_view{card_number}.substr(0, card_number.size() - 1));
    result.major_industry = industry;
    result.issuer = issuer;
    result.personal_digits = extract_personal_digits(card_number);
    result.card_number = std::move(card_number);
    return result;
}

card_result engine::validate(std::string_view card_number) const
{
    auto digits = normalizer_.normalize(card_number);
    const auto &limits = config_.limits;
    if (digits.size() < limits.min_length || digits.size() > limits.max_length) {
        throw invalid_input(fmt::format("card number length {} outside of [{}, {}]",
            digits.size(), limits.min_length, limits.max_length));
    }

    auto result = describe(std::move(digits));
    CCV_DEBUG("Card number validated: valid={}, issuer={}", result.valid,
        result.issuer.has_value() ? issuer_to_string(*result.issuer) : "none");
    return result;
}

card_result engine::generate(std::string_view major_identifier) const
{
    random_entropy entropy{config_.entropy_size};
    return generate(major_identifier, entropy);
}

card_result engine::generate(std::string_view major_identifier, base_entropy &entropy) const
{
    if (!is_digit_sequence(major_identifier)) {
        throw invalid_input("major identifier must be a non-empty sequence of digits");
    }

    auto prefix_class = classifier_.classify(major_identifier);
    auto variant = card_variant::for_issuer(prefix_class.issuer);
    const auto &limits = config_.limits;
    if (variant.target_length < limits.min_length || variant.target_length > limits.max_length) {
        throw invalid_input(fmt::format("card length {} outside of [{}, {}]",
            variant.target_length, limits.min_length, limits.max_length));
    }

    if (major_identifier.size() > variant.target_length - 1) {
        throw invalid_input(fmt::format("major identifier of {} digits too long for a {} digit card",
            major_identifier.size(), variant.target_length));
    }

    generator::card_generator gen{checksum_, entropy};
    auto result = describe(gen.generate(major_identifier, variant.target_length));
    if (!result.valid) {
        throw std::logic_error("generated card number failed the checksum");
    }

    // Reported as the issuer the card length was resolved from
    result.issuer = prefix_class.issuer;

    CCV_DEBUG("Card number generated: length={}, issuer={}", result.card_number.size(),
        result.issuer.has_value() ? issuer_to_string(*result.issuer) : "none");
    return result;
}

} // namespace ccv
