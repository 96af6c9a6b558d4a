// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

namespace ccv {

// Label of the major industry identified by the leading digit of a card
// number, there is no entry for '0'.
std::optional<std::string_view> major_industry_from_digit(char digit);

} // namespace ccv
