// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>

#include "classifier/issuer.hpp"
#include "serializer.hpp"
#include "utils.hpp"

namespace ccv {

namespace {

template <typename Writer> void write_string(Writer &writer, std::string_view str)
{
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

} // namespace

std::string result_serializer::serialize(const card_result &result)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<decltype(buffer)> writer(buffer);

    writer.StartObject();

    writer.Key(STRL("valid"));
    writer.Bool(result.valid);

    writer.Key(STRL("major industry"));
    write_string(writer, result.major_industry);

    writer.Key(STRL("card issuer"));
    if (result.issuer.has_value()) {
        write_string(writer, issuer_to_string(*result.issuer));
    } else {
        writer.Null();
    }

    writer.Key(STRL("card number"));
    write_string(writer, result.card_number);

    writer.Key(STRL("personal digits"));
    write_string(writer, result.personal_digits);

    writer.Key(STRL("check digit"));
    writer.String(&result.check_digit, 1);

    writer.EndObject();

    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace ccv
