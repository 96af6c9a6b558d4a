// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "ccv.h"
#include "common/utils.hpp"

namespace {
// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-c", "--config"},
        {"--config", "--config"}, {"-i", "--input"}, {"--input", "--input"},
        {"--validate", "--validate"}, {"--generate", "--generate"}, {"-v", "--verbose"},
        {"--verbose", "--verbose"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                continue; // Unknown option
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

const char *ret_code_to_str(CCV_RET_CODE code)
{
    switch (code) {
    case CCV_OK:
        return "ok";
    case CCV_ERR_INVALID_ARGUMENT:
        return "invalid argument";
    case CCV_ERR_UNKNOWN_INDUSTRY:
        return "unknown major industry";
    case CCV_ERR_ENTROPY_EXHAUSTED:
        return "entropy exhausted";
    case CCV_ERR_INTERNAL:
        break;
    }
    return "internal error";
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void append_sequence(const YAML::Node &root, std::string_view key, std::vector<std::string> &out)
{
    auto node = root[std::string{key}];
    if (!node) {
        return;
    }

    for (const auto &item : node) { out.emplace_back(item.as<std::string>()); }
}

bool run(ccv_handle handle, const std::vector<std::string> &inputs, bool generate)
{
    bool success = true;
    for (const auto &input : inputs) {
        ccv_result result;
        auto code = generate ? ccv_generate(handle, input.data(), input.size(), &result)
                             : ccv_validate(handle, input.data(), input.size(), &result);
        if (code != CCV_OK) {
            std::cout << "Failed to " << (generate ? "generate from " : "validate ") << input
                      << ": " << ret_code_to_str(code) << '\n';
            success = false;
            continue;
        }
        std::cout << result_to_json(result) << '\n';
    }
    return success;
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    ccv_config config{{0, 0}, 0};
    CCV_LOG_LEVEL level = args.contains("--verbose") ? CCV_LOG_TRACE : CCV_LOG_OFF;

    try {
        if (const auto &files = args["--config"]; !files.empty()) {
            auto root = YAML::Load(read_file(files.front()));
            config = root.as<ccv_config>();
            if (auto log_level = root["log_level"]; log_level && !args.contains("--verbose")) {
                level = str_to_level(log_level.as<std::string>());
            }
        }
    } catch (const std::exception &e) {
        std::cout << "Failed to load configuration: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    ccv_set_log_cb(log_cb, level);

    std::vector<std::string> to_validate = args["--validate"];
    std::vector<std::string> to_generate = args["--generate"];

    try {
        for (const auto &file : args["--input"]) {
            auto root = YAML::Load(read_file(file));
            append_sequence(root, "validate", to_validate);
            append_sequence(root, "generate", to_generate);
        }
    } catch (const std::exception &e) {
        std::cout << "Failed to load input: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (to_validate.empty() && to_generate.empty()) {
        std::cout << "Usage: " << argv[0] << " [--config <yaml file>]"
                  << " [--validate <number> [<number>..]]"
                  << " [--generate <identifier> [<identifier>..]]"
                  << " [--input <yaml file> [<yaml file>..]] [--verbose]\n";
        return EXIT_FAILURE;
    }

    ccv_handle handle = ccv_init(&config);
    if (handle == nullptr) {
        std::cout << "Failed to instantiate handle\n";
        return EXIT_FAILURE;
    }

    bool success = run(handle, to_validate, false);
    success = run(handle, to_generate, true) && success;

    ccv_destroy(handle);

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
