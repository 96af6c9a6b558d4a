// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "classifier/issuer_classifier.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace ccv;

namespace {

TEST(TestIssuerClassifier, Visa)
{
    auto [issuer, industry] = issuer_classifier{}.classify("4111111");
    EXPECT_EQ(issuer, issuer_id::visa);
    EXPECT_STR(industry, "Banking/Financial");
}

TEST(TestIssuerClassifier, AmericanExpress)
{
    EXPECT_EQ(issuer_classifier{}.classify("340000").issuer, issuer_id::american_express);
    EXPECT_EQ(issuer_classifier{}.classify("370000").issuer, issuer_id::american_express);
    EXPECT_STR(issuer_classifier{}.classify("340000").major_industry, "Travel/Entertainment");
}

TEST(TestIssuerClassifier, Discover)
{
    EXPECT_EQ(issuer_classifier{}.classify("601100").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("640000").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("650000").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("6221260").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("6229240").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("6240000").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("6269980").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("6282000").issuer, issuer_id::discover);
    EXPECT_EQ(issuer_classifier{}.classify("6288980").issuer, issuer_id::discover);
}

TEST(TestIssuerClassifier, DiscoverRangeUpperBoundsExcluded)
{
    EXPECT_FALSE(issuer_classifier{}.classify("6221250").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("6229250").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("6269990").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("6288990").issuer.has_value());
}

TEST(TestIssuerClassifier, Mastercard)
{
    EXPECT_EQ(issuer_classifier{}.classify("510000").issuer, issuer_id::mastercard);
    EXPECT_EQ(issuer_classifier{}.classify("520000").issuer, issuer_id::mastercard);
    EXPECT_EQ(issuer_classifier{}.classify("530000").issuer, issuer_id::mastercard);
    EXPECT_EQ(issuer_classifier{}.classify("550000").issuer, issuer_id::mastercard);
    EXPECT_EQ(issuer_classifier{}.classify("222100").issuer, issuer_id::mastercard);
    EXPECT_EQ(issuer_classifier{}.classify("271900").issuer, issuer_id::mastercard);

    EXPECT_FALSE(issuer_classifier{}.classify("540000").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("222000").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("272000").issuer.has_value());
}

TEST(TestIssuerClassifier, OtherIssuers)
{
    EXPECT_EQ(issuer_classifier{}.classify("300000").issuer, issuer_id::diners_club);
    EXPECT_EQ(issuer_classifier{}.classify("350000").issuer, issuer_id::jcb);
    EXPECT_EQ(issuer_classifier{}.classify("620000").issuer, issuer_id::aaa);
}

TEST(TestIssuerClassifier, NoIssuer)
{
    EXPECT_FALSE(issuer_classifier{}.classify("1000000").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("3100000").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("6").issuer.has_value());
    EXPECT_FALSE(issuer_classifier{}.classify("9999999").issuer.has_value());
}

TEST(TestIssuerClassifier, ShortestPrefixWins)
{
    // "4" matches Visa before any longer prefix is considered
    EXPECT_EQ(issuer_classifier::find_issuer("4011000"), issuer_id::visa);
    // "65" matches Discover before "650..." could be compared
    EXPECT_EQ(issuer_classifier::find_issuer("6500000"), issuer_id::discover);
    // "620" is reached before the six digit Discover ranges
    EXPECT_EQ(issuer_classifier::find_issuer("6201260"), issuer_id::aaa);
    // Prefix must be complete for a match
    EXPECT_FALSE(issuer_classifier::find_issuer("601").has_value());
    EXPECT_FALSE(issuer_classifier::find_issuer("").has_value());
}

TEST(TestIssuerClassifier, MajorIndustry)
{
    EXPECT_STR(issuer_classifier{}.classify("1").major_industry, "Airline industry");
    EXPECT_STR(issuer_classifier{}.classify("2").major_industry, "Airline industry");
    EXPECT_STR(issuer_classifier{}.classify("3").major_industry, "Travel/Entertainment");
    EXPECT_STR(issuer_classifier{}.classify("4").major_industry, "Banking/Financial");
    EXPECT_STR(issuer_classifier{}.classify("5").major_industry, "Banking/Financial");
    EXPECT_STR(
        issuer_classifier{}.classify("6").major_industry, "Merchandising & Banking/Financial");
    EXPECT_STR(issuer_classifier{}.classify("7").major_industry, "Petroleum industries");
    EXPECT_STR(issuer_classifier{}.classify("8").major_industry, "Health, telecomm and future");
    EXPECT_STR(
        issuer_classifier{}.classify("9").major_industry, "For assignment by standards bodies");
}

TEST(TestIssuerClassifier, UnknownMajorIndustry)
{
    EXPECT_THROW((void)issuer_classifier{}.classify("0123456"), unknown_major_industry);

    try {
        (void)issuer_classifier{}.classify("0000000");
        FAIL() << "expected unknown_major_industry";
    } catch (const unknown_major_industry &e) {
        EXPECT_EQ(e.digit(), '0');
    }

    // Also catchable as invalid input
    EXPECT_THROW((void)issuer_classifier{}.classify("0"), invalid_input);
    EXPECT_THROW((void)issuer_classifier{}.classify(""), invalid_input);
}

TEST(TestIssuerClassifier, Fixtures)
{
    for (const auto &card : test::read_card_fixtures("cards.yaml")) {
        auto [issuer, industry] = issuer_classifier{}.classify(card.number);
        EXPECT_STR(industry, card.major_industry) << card.number;
        if (card.issuer.has_value()) {
            ASSERT_TRUE(issuer.has_value()) << card.number;
            EXPECT_STR(issuer_to_string(*issuer), *card.issuer) << card.number;
        } else {
            EXPECT_FALSE(issuer.has_value()) << card.number;
        }
    }
}

} // namespace
