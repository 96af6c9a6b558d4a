// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <utility>

#include "entropy/buffer_entropy.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace ccv {

buffer_entropy::buffer_entropy(std::string digits) : digits_(std::move(digits))
{
    for (auto c : digits_) {
        if (!isdigit(c)) {
            throw invalid_input("entropy buffer contains non-digit characters");
        }
    }
}

char buffer_entropy::next_digit()
{
    if (digits_.empty()) {
        throw entropy_exhausted();
    }

    auto digit = digits_.back();
    digits_.pop_back();
    return digit;
}

} // namespace ccv
