// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace ccv::test {

struct card_fixture {
    std::string number;
    bool valid{false};
    std::string major_industry;
    std::optional<std::string> issuer;
};

std::vector<card_fixture> read_card_fixtures(
    std::string_view filename, std::string_view base = "./");

} // namespace ccv::test

namespace YAML {

template <> struct as_if<ccv::test::card_fixture, void> {
    explicit as_if(const Node &node_) : node(node_) {}
    ccv::test::card_fixture operator()() const;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const Node &node;
};

} // namespace YAML
