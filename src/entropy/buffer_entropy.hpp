// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "entropy/base.hpp"

namespace ccv {

// Digits are consumed from the back of the buffer
class buffer_entropy : public base_entropy {
public:
    explicit buffer_entropy(std::string digits);
    buffer_entropy(const buffer_entropy &) = default;
    buffer_entropy &operator=(const buffer_entropy &) = default;
    buffer_entropy(buffer_entropy &&) = default;
    buffer_entropy &operator=(buffer_entropy &&) = default;
    ~buffer_entropy() override = default;

    char next_digit() override;
    [[nodiscard]] std::size_t remaining() const noexcept override { return digits_.size(); }

protected:
    std::string digits_;
};

} // namespace ccv
