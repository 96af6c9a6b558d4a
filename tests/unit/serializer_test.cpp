// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <rapidjson/document.h>
#include <string>

#include "engine.hpp"
#include "serializer.hpp"

#include "common/gtest_utils.hpp"

using namespace ccv;

namespace {

rapidjson::Document parse(const std::string &json)
{
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    EXPECT_FALSE(doc.HasParseError()) << json;
    return doc;
}

TEST(TestResultSerializer, ValidatedCard)
{
    engine eng{engine_config{}};
    auto doc = parse(result_serializer::serialize(eng.validate("4111111111111111")));

    ASSERT_TRUE(doc.IsObject());
    EXPECT_EQ(doc.MemberCount(), 6);

    EXPECT_TRUE(doc["valid"].IsBool());
    EXPECT_TRUE(doc["valid"].GetBool());
    EXPECT_STR(doc["major industry"].GetString(), "Banking/Financial");
    EXPECT_STR(doc["card issuer"].GetString(), "Visa");
    EXPECT_STR(doc["card number"].GetString(), "4111111111111111");
    EXPECT_STR(doc["personal digits"].GetString(), "11111111");
    EXPECT_STR(doc["check digit"].GetString(), "1");
}

TEST(TestResultSerializer, NoIssuer)
{
    engine eng{engine_config{}};
    auto doc = parse(result_serializer::serialize(eng.validate("5427625793410839")));

    ASSERT_TRUE(doc.IsObject());
    EXPECT_FALSE(doc["valid"].GetBool());
    EXPECT_TRUE(doc["card issuer"].IsNull());
    EXPECT_STR(doc["check digit"].GetString(), "6");
}

TEST(TestResultSerializer, ExactOutput)
{
    card_result result;
    result.valid = true;
    result.card_number = "7000003";
    result.major_industry = "Petroleum industries";
    result.check_digit = '3';

    EXPECT_EQ(result_serializer::serialize(result),
        R"({"valid":true,"major industry":"Petroleum industries","card issuer":null,)"
        R"("card number":"7000003","personal digits":"","check digit":"3"})");
}

TEST(TestResultSerializer, EscapedStrings)
{
    card_result result;
    result.valid = false;
    result.card_number = "30000000000004";
    result.major_industry = "Travel/Entertainment";
    result.issuer = issuer_id::diners_club;
    result.check_digit = '4';

    auto json = result_serializer::serialize(result);
    auto doc = parse(json);
    EXPECT_STR(doc["major industry"].GetString(), "Travel/Entertainment");
    EXPECT_STR(doc["card issuer"].GetString(), "Diners Club");
}

} // namespace
