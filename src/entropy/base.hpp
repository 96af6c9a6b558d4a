// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>

namespace ccv {

// Finite supply of pseudo-random decimal digits
class base_entropy {
public:
    base_entropy() = default;
    base_entropy(const base_entropy &) = default;
    base_entropy &operator=(const base_entropy &) = default;
    base_entropy(base_entropy &&) = default;
    base_entropy &operator=(base_entropy &&) = default;
    virtual ~base_entropy() = default;

    // Throws entropy_exhausted once no digits remain
    virtual char next_digit() = 0;
    [[nodiscard]] virtual std::size_t remaining() const noexcept = 0;
};

} // namespace ccv
