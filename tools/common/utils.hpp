// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

#include "ccv.h"

namespace YAML {

template <> struct as_if<ccv_config, void> {
    explicit as_if(const Node &node_) : node(node_) {}
    ccv_config operator()() const;
    const Node &node;
};

} // namespace YAML

const char *level_to_str(CCV_LOG_LEVEL level);
CCV_LOG_LEVEL str_to_level(std::string_view str);

void log_cb(CCV_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

std::string read_file(std::string_view filename);

// Renders the result as JSON through the library serializer
std::string result_to_json(const ccv_result &result);
