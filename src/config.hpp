// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>

#include "ccv.h"
#include "entropy/random_entropy.hpp"

namespace ccv {

struct engine_limits {
    static constexpr std::size_t default_min_length = 7;
    static constexpr std::size_t default_max_length = 18;
    static constexpr std::size_t absolute_min_length = 2;
    static constexpr std::size_t absolute_max_length = CCV_MAX_CARD_LENGTH;

    std::size_t min_length{default_min_length};
    std::size_t max_length{default_max_length};
};

struct engine_config {
    engine_limits limits;
    std::size_t entropy_size{random_entropy::default_size};

    // Throws invalid_input on inconsistent limits
    void validate() const;

    // Zero-valued fields take their default value
    static engine_config from_c_config(const ccv_config *config);
};

} // namespace ccv
