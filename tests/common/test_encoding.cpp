/**
 * @file test_encoding.cpp
 * @brief Hex, base64, base64url and timestamp tests
 */

#include "axiom/common.hpp"

#include <chrono>
#include <string>

#include <gtest/gtest.h>

using namespace axiom::common;

TEST(Hex, EncodesLowercase)
{
    EXPECT_EQ(to_hex(std::string("\x00\xff\x10", 3)), "00ff10");
    EXPECT_TRUE(is_hex_digest(sha256("x")));
    EXPECT_FALSE(is_hex_digest("ABCDEF", 6));
    EXPECT_FALSE(is_hex_digest("abc", 64));
}

TEST(Base64, KnownVectors)
{
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");

    auto decoded = base64_decode("Zm8=");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, "fo");
}

TEST(Base64, RejectsBadInput)
{
    EXPECT_FALSE(base64_decode("Zm9"));
    EXPECT_FALSE(base64_decode("Zm9*"));
}

TEST(Base64Url, UnpaddedUrlAlphabet)
{
    const std::string bytes("\xfb\xff\xbf", 3);
    EXPECT_EQ(base64_encode(bytes), "+/+/");
    EXPECT_EQ(base64url_encode(bytes), "-_-_");
    EXPECT_EQ(base64url_encode("f"), "Zg");

    auto decoded = base64url_decode("Zg");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, "f");

    EXPECT_FALSE(base64url_decode("+/+/"));
}

TEST(Rfc3339, FormatsUtcSeconds)
{
    using namespace std::chrono;
    const axiom::WallClock::time_point tp = sys_days{year{2024} / 1 / 31} + hours{12} + minutes{5} + seconds{9}
                                     + milliseconds{750};
    EXPECT_EQ(format_rfc3339(tp), "2024-01-31T12:05:09Z");

    auto parsed = parse_rfc3339("2024-01-31T12:05:09Z");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, floor<seconds>(tp));
}

TEST(Rfc3339, RejectsMalformed)
{
    EXPECT_FALSE(parse_rfc3339("2024-01-31 12:05:09Z"));
    EXPECT_FALSE(parse_rfc3339("2024-02-30T00:00:00Z"));
    EXPECT_FALSE(parse_rfc3339("2024-01-31T24:00:00Z"));
}
