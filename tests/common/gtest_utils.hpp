// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/core.h>
#include <ostream>
#include <string_view>

#include "classifier/issuer.hpp"

#include "common/yaml_utils.hpp"

#define EXPECT_STR(a, b) EXPECT_EQ(std::string_view{a}, std::string_view{b})
#define EXPECT_STRV(a, b) EXPECT_STR(a, b)

namespace ccv {

// Required by gtest to pretty print relevant types
inline void PrintTo(issuer_id id, ::std::ostream *os) { *os << issuer_to_string(id); }

} // namespace ccv
