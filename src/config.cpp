// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <fmt/format.h>

#include "ccv.h"
#include "config.hpp"
#include "exception.hpp"

namespace ccv {

void engine_config::validate() const
{
    if (limits.min_length < engine_limits::absolute_min_length) {
        throw invalid_input(fmt::format("minimum length {} below {}", limits.min_length,
            engine_limits::absolute_min_length));
    }

    if (limits.max_length < limits.min_length) {
        throw invalid_input(fmt::format(
            "maximum length {} below minimum length {}", limits.max_length, limits.min_length));
    }

    if (limits.max_length > engine_limits::absolute_max_length) {
        throw invalid_input(fmt::format("maximum length {} above {}", limits.max_length,
            engine_limits::absolute_max_length));
    }

    if (entropy_size == 0) {
        throw invalid_input("entropy size must be non-zero");
    }
}

engine_config engine_config::from_c_config(const ccv_config *config)
{
    engine_config cfg;
    if (config == nullptr) {
        return cfg;
    }

    if (config->limits.min_length != 0) {
        cfg.limits.min_length = config->limits.min_length;
    }

    if (config->limits.max_length != 0) {
        cfg.limits.max_length = config->limits.max_length;
    }

    if (config->entropy_size != 0) {
        cfg.entropy_size = config->entropy_size;
    }

    return cfg;
}

} // namespace ccv
