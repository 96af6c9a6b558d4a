// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <optional>

#include "classifier/issuer.hpp"

namespace ccv {

struct card_variant {
    std::size_t target_length;

    static constexpr std::size_t default_length = 16;
    static constexpr std::size_t diners_club_length = 14;
    static constexpr std::size_t american_express_length = 15;

    static constexpr card_variant for_issuer(std::optional<issuer_id> issuer) noexcept
    {
        if (issuer == issuer_id::diners_club) {
            return {diners_club_length};
        }

        if (issuer == issuer_id::american_express) {
            return {american_express_length};
        }

        return {default_length};
    }
};

} // namespace ccv
