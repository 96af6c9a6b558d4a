// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>

#include "entropy/buffer_entropy.hpp"

namespace ccv {

// Hex encodes `bytes` bytes drawn from the system random device and keeps
// the decimal characters. The buffer is never refilled.
class random_entropy : public buffer_entropy {
public:
    static constexpr std::size_t default_size = 40;

    explicit random_entropy(std::size_t bytes = default_size);
    random_entropy(const random_entropy &) = default;
    random_entropy &operator=(const random_entropy &) = default;
    random_entropy(random_entropy &&) = default;
    random_entropy &operator=(random_entropy &&) = default;
    ~random_entropy() override = default;

    static std::string draw(std::size_t bytes);
};

} // namespace ccv
