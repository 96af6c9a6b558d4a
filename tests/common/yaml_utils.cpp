// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "log.hpp"

#include "common/yaml_utils.hpp"

namespace YAML {

ccv::test::card_fixture as_if<ccv::test::card_fixture, void>::operator()() const
{
    ccv::test::card_fixture fixture;
    fixture.number = node["number"].as<std::string>();
    fixture.valid = node["valid"].as<bool>();
    fixture.major_industry = node["major_industry"].as<std::string>();
    if (auto issuer = node["issuer"]; issuer && !issuer.IsNull()) {
        fixture.issuer = issuer.as<std::string>();
    }
    return fixture;
}

} // namespace YAML

namespace ccv::test {

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
std::vector<card_fixture> read_card_fixtures(std::string_view filename, std::string_view base)
{
    std::string base_dir{base};
    if (base_dir.empty() || base_dir.back() != '/') {
        base_dir += '/';
    }

    auto file_path = base_dir + "yaml/" + std::string{filename};

    CCV_DEBUG("Opening {}", file_path);

    std::ifstream file(file_path.c_str(), std::ios::in);
    if (!file) {
        throw std::runtime_error("unable to open " + file_path);
    }

    auto root = YAML::Load(file);

    std::vector<card_fixture> fixtures;
    for (const auto &card : root["cards"]) {
        fixtures.emplace_back(card.as<card_fixture>());
    }
    return fixtures;
}

} // namespace ccv::test
