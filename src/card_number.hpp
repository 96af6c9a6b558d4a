// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>

namespace ccv {

// Accepts a plain run of digits or digit groups separated by single spaces
// or single dashes, e.g. "4111 1111 1111 1111" or "4111-1111-1111-1111".
class card_number_normalizer {
public:
    card_number_normalizer();
    card_number_normalizer(const card_number_normalizer &) = delete;
    card_number_normalizer &operator=(const card_number_normalizer &) = delete;
    card_number_normalizer(card_number_normalizer &&) noexcept = default;
    card_number_normalizer &operator=(card_number_normalizer &&) noexcept = default;
    ~card_number_normalizer() = default;

    // Returns the digits of the input, throws invalid_input if malformed
    [[nodiscard]] std::string normalize(std::string_view input) const;

protected:
    std::unique_ptr<re2::RE2> regex_{nullptr};
};

} // namespace ccv
