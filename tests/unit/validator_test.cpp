// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "imei.hpp"
#include "validator.hpp"

#include "common/gtest_utils.hpp"
#include "common/reference_checksum.hpp"

using namespace imei;
using namespace std::literals;

namespace {

TEST(TestValidator, ValidIMEI)
{
    EXPECT_TRUE(valid("490154203237518"));
    EXPECT_TRUE(valid("354406185514933"));
    EXPECT_TRUE(valid("522872587498800"));
}

TEST(TestValidator, InvalidIMEI)
{
    EXPECT_FALSE(valid("123456789012345"));
    EXPECT_FALSE(valid("12345678901234"));
    EXPECT_FALSE(valid("12345678901234A"));
}

TEST(TestValidator, Deterministic)
{
    for (unsigned i = 0; i < 3; ++i) {
        EXPECT_TRUE(valid("490154203237518"));
        EXPECT_FALSE(valid("123456789012345"));
    }
}

TEST(TestValidator, ValidateReturnsNothingOnSuccess)
{
    EXPECT_FALSE(validate("490154203237518").has_value());
}

TEST(TestValidator, ValidateReason)
{
    auto error = validate("123456789012345");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->cause(), validation_error::reason::invalid_checksum);

    error = validate("12345678901234");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->cause(), validation_error::reason::invalid_length);

    error = validate("12345678901234A");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->cause(), validation_error::reason::invalid_character);
}

TEST(TestValidator, SingleErrorKind)
{
    auto length = validate("12345678901234");
    auto character = validate("12345678901234A");
    auto checksum = validate("123456789012345");
    ASSERT_TRUE(length && character && checksum);

    EXPECT_EQ(*length, *character);
    EXPECT_EQ(*character, *checksum);
    EXPECT_STR(length->message(), "invalid IMEI");
    EXPECT_STR(checksum->message(), "invalid IMEI");
}

TEST(TestValidator, ReasonToString)
{
    EXPECT_STR(reason_to_str(validation_error::reason::invalid_length), "invalid length");
    EXPECT_STR(reason_to_str(validation_error::reason::invalid_character), "invalid character");
    EXPECT_STR(reason_to_str(validation_error::reason::invalid_checksum), "invalid checksum");
}

TEST(TestValidator, ComputeCheckDigit)
{
    EXPECT_EQ(compute_check_digit("52287258749880"), 0);
    EXPECT_FALSE(compute_check_digit("5228725874988").has_value());
}

TEST(TestValidator, Vectors)
{
    auto vectors = test::read_vectors("imei_vectors.yaml");
    ASSERT_FALSE(vectors.empty());

    for (const auto &vector : vectors) {
        auto error = validate(vector.value);
        EXPECT_EQ(valid(vector.value), !vector.reason.has_value()) << vector.value;
        EXPECT_EQ(error.has_value(), vector.reason.has_value()) << vector.value;
        if (error.has_value() && vector.reason.has_value()) {
            EXPECT_EQ(error->cause(), *vector.reason) << vector.value;
        }
    }
}

TEST(TestValidator, CheckDigitMatchesVectors)
{
    for (const auto &vector : test::read_vectors("imei_vectors.yaml")) {
        if (vector.reason.has_value()) {
            continue;
        }

        auto digit = compute_check_digit(std::string_view{vector.value}.substr(0, 14));
        ASSERT_TRUE(digit.has_value()) << vector.value;
        EXPECT_EQ(static_cast<char>('0' + *digit), vector.value.back()) << vector.value;
    }
}

TEST(TestValidator, AgreesWithFullScanOnEverySubstitution)
{
    for (const auto &vector : test::read_vectors("imei_vectors.yaml")) {
        if (vector.reason.has_value()) {
            continue;
        }

        std::string str = vector.value;
        for (std::size_t i = 0; i < str.size(); ++i) {
            const char original = str[i];
            for (unsigned byte = 0; byte < 256; ++byte) {
                str[i] = static_cast<char>(byte);
                ASSERT_EQ(valid(str), test::full_scan_valid(str)) << vector.value << " " << i
                                                                  << " " << byte;
            }
            str[i] = original;
        }
    }
}

TEST(TestValidator, AgreesWithFullScanOnTruncationAndExtension)
{
    for (const auto &vector : test::read_vectors("imei_vectors.yaml")) {
        std::string_view str{vector.value};
        for (std::size_t len = 0; len <= str.size(); ++len) {
            EXPECT_EQ(valid(str.substr(0, len)), test::full_scan_valid(str.substr(0, len)))
                << vector.value << " " << len;
        }

        auto extended = vector.value + "0";
        EXPECT_FALSE(valid(extended));
        EXPECT_EQ(valid(extended), test::full_scan_valid(extended));
    }
}

TEST(TestValidator, ConcurrentValidation)
{
    auto vectors = test::read_vectors("imei_vectors.yaml");
    ASSERT_FALSE(vectors.empty());

    std::atomic<unsigned> mismatches{0};
    std::vector<std::thread> threads;
    for (unsigned t = 0; t < 8; ++t) {
        threads.emplace_back([&vectors, &mismatches]() {
            for (unsigned round = 0; round < 500; ++round) {
                for (const auto &vector : vectors) {
                    const bool expected = !vector.reason.has_value();
                    if (valid(vector.value) != expected) {
                        ++mismatches;
                    }

                    auto result = owned_imei::try_new(vector.value);
                    if (std::holds_alternative<owned_imei>(result) != expected) {
                        ++mismatches;
                    }
                }
            }
        });
    }

    for (auto &thread : threads) { thread.join(); }

    EXPECT_EQ(mismatches.load(), 0U);
}

} // namespace
