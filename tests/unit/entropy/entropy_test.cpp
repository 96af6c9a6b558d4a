// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "entropy/buffer_entropy.hpp"
#include "entropy/random_entropy.hpp"
#include "exception.hpp"
#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace ccv;

namespace {

TEST(TestBufferEntropy, ConsumesFromTheBack)
{
    buffer_entropy entropy{"123"};
    EXPECT_EQ(entropy.remaining(), 3);
    EXPECT_EQ(entropy.next_digit(), '3');
    EXPECT_EQ(entropy.next_digit(), '2');
    EXPECT_EQ(entropy.next_digit(), '1');
    EXPECT_EQ(entropy.remaining(), 0);
}

TEST(TestBufferEntropy, Exhausted)
{
    buffer_entropy entropy{"7"};
    EXPECT_EQ(entropy.next_digit(), '7');
    EXPECT_THROW(entropy.next_digit(), entropy_exhausted);
    EXPECT_THROW(entropy.next_digit(), entropy_exhausted);

    buffer_entropy empty{""};
    EXPECT_THROW(empty.next_digit(), entropy_exhausted);
}

TEST(TestBufferEntropy, RejectsNonDigits)
{
    EXPECT_THROW(buffer_entropy{"12a4"}, invalid_input);
    EXPECT_THROW(buffer_entropy{"12 4"}, invalid_input);
}

TEST(TestRandomEntropy, DrawOnlyDigits)
{
    for (unsigned i = 0; i < 16; ++i) {
        auto digits = random_entropy::draw(random_entropy::default_size);
        // Each byte yields up to two decimal characters
        EXPECT_LE(digits.size(), random_entropy::default_size * 2);
        for (auto c : digits) {
            EXPECT_TRUE(isdigit(c));
        }
    }
}

TEST(TestRandomEntropy, BoundedSupply)
{
    random_entropy entropy{1};
    EXPECT_LE(entropy.remaining(), 2);

    auto remaining = entropy.remaining();
    for (std::size_t i = 0; i < remaining; ++i) {
        EXPECT_TRUE(isdigit(entropy.next_digit()));
    }
    EXPECT_THROW(entropy.next_digit(), entropy_exhausted);
}

TEST(TestRandomEntropy, ZeroBytes)
{
    random_entropy entropy{0};
    EXPECT_EQ(entropy.remaining(), 0);
    EXPECT_THROW(entropy.next_digit(), entropy_exhausted);
}

} // namespace
