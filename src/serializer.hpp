// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>

#include "engine.hpp"

namespace ccv {

// Renders a card result as a JSON object:
//   {"valid": ..., "major industry": ..., "card issuer": ... | null,
//    "card number": ..., "personal digits": ..., "check digit": ...}
class result_serializer {
public:
    static std::string serialize(const card_result &result);
};

} // namespace ccv
