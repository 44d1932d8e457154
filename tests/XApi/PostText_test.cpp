/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <string>

#include <XPost/XApi/PostText.hpp>

using namespace XPost::XApi;

TEST(PostTextTest, CountsAsciiCharacters)
{
	EXPECT_EQ(countPostLength(""), 0u);
	EXPECT_EQ(countPostLength("Hello world"), 11u);
}

TEST(PostTextTest, CountsCodePointsNotBytes)
{
	// "日本語" is 9 bytes, "é" is 2 and the emoji is 4.
	EXPECT_EQ(countPostLength("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"), 3u);
	EXPECT_EQ(countPostLength("caf\xC3\xA9"), 4u);
	EXPECT_EQ(countPostLength("\xF0\x9F\x98\x80!"), 2u);
}

TEST(PostTextTest, UrlCountsAsShortLink)
{
	const std::string url = "https://example.com/a/very/long/path/that/goes/on/and/on/for/a/while";
	EXPECT_EQ(countPostLength(url), kShortUrlLength);
	EXPECT_EQ(countPostLength("see " + url + " now"), 4u + kShortUrlLength + 4u);
}

TEST(PostTextTest, ShortUrlStillCountsAsShortLink)
{
	EXPECT_EQ(countPostLength("http://a.b"), kShortUrlLength);
}

TEST(PostTextTest, SchemeIsCaseInsensitive)
{
	EXPECT_EQ(countPostLength("HTTPS://EXAMPLE.COM"), kShortUrlLength);
}

TEST(PostTextTest, BareSchemeIsNotAUrl)
{
	EXPECT_EQ(countPostLength("https://"), 8u);
	EXPECT_EQ(countPostLength("https:// x"), 10u);
}

TEST(PostTextTest, EveryUrlIsCounted)
{
	EXPECT_EQ(countPostLength("http://a.example\nhttps://b.example"), 2 * kShortUrlLength + 1u);
}

TEST(PostTextTest, UrlEndsAtUnicodeWhitespace)
{
	// U+3000 IDEOGRAPHIC SPACE
	EXPECT_EQ(countPostLength("https://example.com\xE3\x80\x80x"), kShortUrlLength + 2u);
}

TEST(PostTextTest, InvalidBytesCountOneEach)
{
	EXPECT_EQ(countPostLength("a\xFF\xFE" "b"), 4u);
	// Truncated three-byte sequence.
	EXPECT_EQ(countPostLength("\xE6\x97"), 2u);
}

TEST(PostTextTest, LimitBoundary)
{
	EXPECT_EQ(countPostLength(std::string(kMaxPostLength, 'x')), kMaxPostLength);
	EXPECT_EQ(countPostLength(std::string(kMaxPostLength + 1, 'x')), kMaxPostLength + 1);
}
