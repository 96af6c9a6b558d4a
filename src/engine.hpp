// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "card_number.hpp"
#include "checksum/luhn_checksum.hpp"
#include "classifier/issuer.hpp"
#include "classifier/issuer_classifier.hpp"
#include "config.hpp"
#include "entropy/base.hpp"

namespace ccv {

struct card_result {
    bool valid{false};
    std::string card_number;
    std::string_view major_industry;
    std::optional<issuer_id> issuer;
    // Digits from the eighth position up to the check digit
    std::string personal_digits;
    // Check digit computed over the card number, which may differ from its
    // last digit when the number is invalid
    char check_digit{'0'};
};

class engine {
public:
    explicit engine(engine_config config);
    engine(const engine &) = delete;
    engine &operator=(const engine &) = delete;
    engine(engine &&) noexcept = default;
    engine &operator=(engine &&) noexcept = default;
    ~engine() = default;

    [[nodiscard]] card_result validate(std::string_view card_number) const;

    [[nodiscard]] card_result generate(std::string_view major_identifier) const;
    [[nodiscard]] card_result generate(
        std::string_view major_identifier, base_entropy &entropy) const;

    [[nodiscard]] const engine_config &config() const noexcept { return config_; }

protected:
    [[nodiscard]] card_result describe(std::string card_number) const;

    engine_config config_;
    luhn_checksum checksum_;
    issuer_classifier classifier_;
    card_number_normalizer normalizer_;
};

} // namespace ccv
