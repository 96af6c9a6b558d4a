// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

#include "common/utils.hpp"

using namespace std::literals;

namespace YAML {

ccv_config as_if<ccv_config, void>::operator()() const
{
    ccv_config config{{0, 0}, 0};
    if (auto value = node["min_length"]; value) {
        config.limits.min_length = value.as<uint16_t>();
    }
    if (auto value = node["max_length"]; value) {
        config.limits.max_length = value.as<uint16_t>();
    }
    if (auto value = node["entropy_size"]; value) {
        config.entropy_size = value.as<uint16_t>();
    }
    return config;
}

} // namespace YAML

const char *level_to_str(CCV_LOG_LEVEL level)
{
    switch (level) {
    case CCV_LOG_TRACE:
        return "trace";
    case CCV_LOG_DEBUG:
        return "debug";
    case CCV_LOG_ERROR:
        return "error";
    case CCV_LOG_WARN:
        return "warn";
    case CCV_LOG_INFO:
        return "info";
    case CCV_LOG_OFF:
        break;
    }

    return "off";
}

CCV_LOG_LEVEL str_to_level(std::string_view str)
{
    if (str == "trace"sv) {
        return CCV_LOG_TRACE;
    }
    if (str == "debug"sv) {
        return CCV_LOG_DEBUG;
    }
    if (str == "info"sv) {
        return CCV_LOG_INFO;
    }
    if (str == "warn"sv) {
        return CCV_LOG_WARN;
    }
    if (str == "error"sv) {
        return CCV_LOG_ERROR;
    }
    return CCV_LOG_OFF;
}

void log_cb(CCV_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream file(std::string{filename}, std::ios::in);
    if (!file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    file.seekg(0, std::ios::end);
    buffer.resize(file.tellg());
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    file.close();
    return buffer;
}

std::string result_to_json(const ccv_result &result)
{
    std::string buffer;
    buffer.resize(ccv_result_serialize(&result, nullptr, 0));
    // The serializer writes the terminator in the extra byte
    buffer.resize(buffer.size() + 1);
    auto length = ccv_result_serialize(&result, buffer.data(), buffer.size());
    buffer.resize(length);
    return buffer;
}
