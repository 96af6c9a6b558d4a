// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

#include "classifier/issuer.hpp"

namespace ccv {

struct classification {
    std::optional<issuer_id> issuer;
    std::string_view major_industry;
};

class issuer_classifier {
public:
    issuer_classifier() = default;
    issuer_classifier(const issuer_classifier &) = default;
    issuer_classifier &operator=(const issuer_classifier &) = default;
    issuer_classifier(issuer_classifier &&) = default;
    issuer_classifier &operator=(issuer_classifier &&) = default;
    ~issuer_classifier() = default;

    // The sequence must be a non-empty run of digits, throws
    // unknown_major_industry when it starts with '0'.
    [[nodiscard]] classification classify(std::string_view sequence) const;

    // The shortest prefix matching a range wins, ties at the same prefix
    // length are resolved by table order.
    [[nodiscard]] static std::optional<issuer_id> find_issuer(std::string_view sequence) noexcept;
};

} // namespace ccv
