// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <memory>
#include <re2/re2.h>
#include <stdexcept>
#include <string>
#include <string_view>

#include "card_number.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace ccv {

card_number_normalizer::card_number_normalizer()
{
    constexpr unsigned regex_max_mem = 64 * 1024;

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);

    regex_ = std::make_unique<re2::RE2>("[0-9]+(?: [0-9]+)*|[0-9]+(?:-[0-9]+)*", options);
    if (!regex_->ok()) {
        throw std::runtime_error("invalid regular expression: " + regex_->error_arg());
    }
}

std::string card_number_normalizer::normalize(std::string_view input) const
{
    if (input.empty()) {
        throw invalid_input("empty card number");
    }

    if (!regex_->Match(input, 0, input.size(), re2::RE2::ANCHOR_BOTH, nullptr, 0)) {
        throw invalid_input("card number contains invalid characters");
    }

    std::string digits;
    digits.reserve(input.size());
    for (auto c : input) {
        if (isdigit(c)) {
            digits.push_back(c);
        }
    }
    return digits;
}

} // namespace ccv
