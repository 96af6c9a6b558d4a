// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>

#include "ccv.h"
#include "classifier/issuer.hpp"
#include "classifier/major_industry.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "entropy/buffer_entropy.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "serializer.hpp"
#include "utils.hpp"
#include "version.hpp"

using namespace ccv;

// Log level compatibility
static_assert(static_cast<unsigned>(log_level::trace) == CCV_LOG_TRACE);
static_assert(static_cast<unsigned>(log_level::debug) == CCV_LOG_DEBUG);
static_assert(static_cast<unsigned>(log_level::info) == CCV_LOG_INFO);
static_assert(static_cast<unsigned>(log_level::warn) == CCV_LOG_WARN);
static_assert(static_cast<unsigned>(log_level::error) == CCV_LOG_ERROR);
static_assert(static_cast<unsigned>(log_level::off) == CCV_LOG_OFF);

namespace {

ccv_log_cb binding_log_cb = nullptr;

void relay_log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    if (binding_log_cb != nullptr) {
        binding_log_cb(
            static_cast<CCV_LOG_LEVEL>(level), function, file, line, message, message_len);
    }
}

template <std::size_t N>
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
std::string_view bounded_string(const char (&src)[N])
{
    const auto *end = std::find(std::begin(src), std::end(src), '\0');
    return {std::begin(src), static_cast<std::size_t>(end - std::begin(src))};
}

template <std::size_t N>
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
void copy_digits(char (&dest)[N], std::string_view src)
{
    auto length = std::min(src.size(), N - 1);
    std::memcpy(dest, src.data(), length);
    dest[length] = '\0';
}

void to_c_result(const card_result &result, ccv_result &output)
{
    output.valid = result.valid;
    // Both strings reference static storage and are NUL-terminated
    output.major_industry = result.major_industry.data();
    output.issuer =
        result.issuer.has_value() ? issuer_to_string(*result.issuer).data() : nullptr;
    copy_digits(output.card_number, result.card_number);
    copy_digits(output.personal_digits, result.personal_digits);
    output.check_digit = result.check_digit;
}

card_result from_c_result(const ccv_result &input)
{
    card_result result;
    result.valid = input.valid;
    if (input.major_industry != nullptr) {
        result.major_industry = input.major_industry;
    }
    if (input.issuer != nullptr) {
        result.issuer = issuer_from_string(input.issuer);
    }
    result.card_number = bounded_string(input.card_number);
    result.personal_digits = bounded_string(input.personal_digits);
    result.check_digit = input.check_digit;
    return result;
}

template <typename Fn>
CCV_RET_CODE run_operation(ccv_handle handle, const char *input, std::size_t length,
    ccv_result *result, Fn &&operation)
{
    if (handle == nullptr || input == nullptr || result == nullptr) {
        CCV_WARN("Tried to run an operation with a null argument");
        return CCV_ERR_INVALID_ARGUMENT;
    }

    try {
        to_c_result(operation(*handle, std::string_view{input, length}), *result);
        return CCV_OK;
    } catch (const unknown_major_industry &e) {
        CCV_WARN("{}", e.what());
        return CCV_ERR_UNKNOWN_INDUSTRY;
    } catch (const invalid_input &e) {
        CCV_WARN("{}", e.what());
        return CCV_ERR_INVALID_ARGUMENT;
    } catch (const entropy_exhausted &e) {
        CCV_ERROR("{}", e.what());
        return CCV_ERR_ENTROPY_EXHAUSTED;
    } catch (const std::exception &e) {
        CCV_ERROR("{}", e.what());
    }
    return CCV_ERR_INTERNAL;
}

} // namespace

extern "C" {

ccv::engine *ccv_init(const ccv_config *config)
{
    try {
        return new ccv::engine(engine_config::from_c_config(config));
    } catch (const std::exception &e) {
        CCV_ERROR("{}", e.what());
    }
    return nullptr;
}

void ccv_destroy(ccv::engine *handle)
{
    if (handle == nullptr) {
        return;
    }

    delete handle;
}

CCV_RET_CODE ccv_validate(
    ccv::engine *handle, const char *card_number, size_t length, ccv_result *result)
{
    return run_operation(handle, card_number, length, result,
        [](const engine &eng, std::string_view input) { return eng.validate(input); });
}

CCV_RET_CODE ccv_generate(
    ccv::engine *handle, const char *major_identifier, size_t length, ccv_result *result)
{
    return run_operation(handle, major_identifier, length, result,
        [](const engine &eng, std::string_view input) { return eng.generate(input); });
}

CCV_RET_CODE ccv_generate_with_entropy(ccv::engine *handle, const char *major_identifier,
    size_t length, const char *entropy, size_t entropy_length, ccv_result *result)
{
    if (entropy == nullptr) {
        CCV_WARN("Tried to generate a card number with null entropy");
        return CCV_ERR_INVALID_ARGUMENT;
    }

    return run_operation(handle, major_identifier, length, result,
        [entropy, entropy_length](const engine &eng, std::string_view input) {
            buffer_entropy source{std::string{entropy, entropy_length}};
            return eng.generate(input, source);
        });
}

size_t ccv_result_serialize(const ccv_result *result, char *buffer, size_t size)
{
    if (result == nullptr) {
        return 0;
    }

    try {
        auto json = result_serializer::serialize(from_c_result(*result));
        if (buffer != nullptr && size > 0) {
            auto length = std::min(json.size(), size - 1);
            std::memcpy(buffer, json.data(), length);
            buffer[length] = '\0';
        }
        return json.size();
    } catch (const std::exception &e) {
        CCV_ERROR("{}", e.what());
    }
    return 0;
}

const char *ccv_get_version() { return current_version.data(); }

bool ccv_set_log_cb(ccv_log_cb cb, CCV_LOG_LEVEL min_level)
{
    binding_log_cb = cb;
    auto level = static_cast<ccv::log_level>(min_level);
    ccv::logger::init(cb != nullptr ? relay_log : nullptr, level);
    CCV_INFO("Sending log messages to binding, min level {}", ccv::log_level_to_str(level));
    return true;
}
}
