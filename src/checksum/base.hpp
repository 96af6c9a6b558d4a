// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

namespace ccv {

class base_checksum {
public:
    base_checksum() = default;
    base_checksum(const base_checksum &) = default;
    base_checksum &operator=(const base_checksum &) = default;
    base_checksum(base_checksum &&) = default;
    base_checksum &operator=(base_checksum &&) = default;
    virtual ~base_checksum() = default;

    // Check digit for a sequence which doesn't include the check position,
    // the sequence must be a non-empty run of digits.
    [[nodiscard]] virtual char compute(std::string_view str) const noexcept = 0;
    [[nodiscard]] virtual bool validate(std::string_view str) const noexcept = 0;
};

} // namespace ccv
