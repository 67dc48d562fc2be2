// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "checksum/imei_checksum.hpp"

#include "common/gtest_utils.hpp"

using namespace imei;

namespace {

bool passes(std::string_view str) { return imei_checksum::check(str) == imei_check_result::valid; }

TEST(TestImeiChecksum, Valid)
{
    EXPECT_TRUE(passes("490154203237518"));
    EXPECT_TRUE(passes("354406185514933"));
    EXPECT_TRUE(passes("522872587498800"));
    EXPECT_TRUE(passes("350009218041876"));

    // Edge case
    EXPECT_TRUE(passes("000000000000000"));
}

TEST(TestImeiChecksum, Invalid)
{
    EXPECT_FALSE(passes("123456789012345"));
    EXPECT_FALSE(passes("12345678901234"));
    EXPECT_FALSE(passes("12345678901234A"));
    EXPECT_FALSE(passes(""));
    EXPECT_FALSE(passes("               "));

    // Separators are not skipped
    EXPECT_FALSE(passes("35000921-8041876"));
    EXPECT_FALSE(passes("3500 0921 8041 876"));
}

TEST(TestImeiChecksum, CheckResult)
{
    EXPECT_EQ(imei_checksum::check("490154203237518"), imei_check_result::valid);
    EXPECT_EQ(imei_checksum::check("123456789012345"), imei_check_result::invalid_checksum);
    EXPECT_EQ(imei_checksum::check("12345678901234"), imei_check_result::invalid_length);
    EXPECT_EQ(imei_checksum::check("1234567890123456"), imei_check_result::invalid_length);
    EXPECT_EQ(imei_checksum::check("12345678901234A"), imei_check_result::invalid_character);
}

TEST(TestImeiChecksum, LengthCheckedBeforeCharacters)
{
    // Short input with a non-digit is reported as a length failure
    EXPECT_EQ(imei_checksum::check("ABC"), imei_check_result::invalid_length);
}

TEST(TestImeiChecksum, FirstInvalidCharacterStopsScan)
{
    // The checksum of the remaining digits is irrelevant
    EXPECT_EQ(imei_checksum::check("X90154203237518"), imei_check_result::invalid_character);
    EXPECT_EQ(imei_checksum::check("4901542032375X8"), imei_check_result::invalid_character);
}

TEST(TestImeiChecksum, NonAsciiBytes)
{
    std::string str{"49015420323751"};
    str.push_back(static_cast<char>(0xB8));
    EXPECT_EQ(imei_checksum::check(str), imei_check_result::invalid_character);

    std::string with_nul{"4901542032375"};
    with_nul.push_back('\0');
    with_nul.push_back('8');
    EXPECT_EQ(imei_checksum::check(with_nul), imei_check_result::invalid_character);
}

TEST(TestImeiChecksum, DoublingAppliesToEvenPositions)
{
    // Only position 2 (1-indexed) holds a non-zero digit: 5 * 2 = 10 -> 1,
    // so the check digit must be 9
    EXPECT_TRUE(passes("050000000000009"));
    EXPECT_FALSE(passes("050000000000000"));

    // Same digit on an odd position isn't doubled, 5 + 5 = 10
    EXPECT_TRUE(passes("500000000000005"));
}

TEST(TestImeiChecksum, ComputeCheckDigit)
{
    EXPECT_EQ(imei_checksum::compute_check_digit("49015420323751"), 8);
    EXPECT_EQ(imei_checksum::compute_check_digit("35440618551493"), 3);
    EXPECT_EQ(imei_checksum::compute_check_digit("52287258749880"), 0);
    EXPECT_EQ(imei_checksum::compute_check_digit("00000000000000"), 0);
    EXPECT_EQ(imei_checksum::compute_check_digit("12345678901234"), 7);

    EXPECT_FALSE(imei_checksum::compute_check_digit("4901542032375").has_value());
    EXPECT_FALSE(imei_checksum::compute_check_digit("490154203237518").has_value());
    EXPECT_FALSE(imei_checksum::compute_check_digit("4901542032375A").has_value());
    EXPECT_FALSE(imei_checksum::compute_check_digit("").has_value());
}

TEST(TestImeiChecksum, EveryCheckDigitButOneFails)
{
    std::string str{"35440618551493"};
    str.push_back('0');
    unsigned valid_count = 0;
    for (char c = '0'; c <= '9'; ++c) {
        str.back() = c;
        if (passes(str)) {
            EXPECT_EQ(c, '3');
            ++valid_count;
        }
    }
    EXPECT_EQ(valid_count, 1U);
}

} // namespace
