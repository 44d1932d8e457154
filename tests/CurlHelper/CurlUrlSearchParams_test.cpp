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
#include <utility>

#include <XPost/CurlHelper/CurlHandle.hpp>
#include <XPost/CurlHelper/CurlSlistHandle.hpp>
#include <XPost/CurlHelper/CurlUrlHandle.hpp>
#include <XPost/CurlHelper/CurlUrlSearchParams.hpp>
#include <XPost/CurlHelper/CurlWriteCallback.hpp>

using namespace XPost::CurlHelper;

class CurlUrlSearchParamsTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }
};

TEST_F(CurlUrlSearchParamsTest, NullCurlIsRejected)
{
	EXPECT_THROW(CurlUrlSearchParams(nullptr), std::invalid_argument);
}

TEST_F(CurlUrlSearchParamsTest, ToStringEncodesInInsertionOrder)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl.getRaw());
	params.append("scope", "tweet.read users.read");
	params.append("redirect_uri", "http://localhost:8000/callback");

	EXPECT_EQ(params.toString(), "scope=tweet.read%20users.read&redirect_uri=http%3A%2F%2Flocalhost%3A8000%2Fcallback");
	EXPECT_EQ(params.size(), 2u);
}

TEST_F(CurlUrlSearchParamsTest, ParseDecodesPercentAndPlus)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl.getRaw());
	params.parse("code=abc%2F123&error=access+denied&flag");

	EXPECT_EQ(params.get("code"), "abc/123");
	EXPECT_EQ(params.get("error"), "access denied");
	EXPECT_EQ(params.get("flag"), "");
	EXPECT_EQ(params.get("state"), std::nullopt);
}

TEST_F(CurlUrlSearchParamsTest, UrlHandleAppendsQuery)
{
	CurlHandle curl;
	CurlUrlSearchParams params(curl.getRaw());
	params.append("a", "1");
	params.append("b", "x y");

	CurlUrlHandle url;
	url.setUrl("https://example.com/path");
	EXPECT_EQ(url.query(), "");

	url.appendQuery(params.toString());
	EXPECT_EQ(url.query(), "a=1&b=x%20y");
	EXPECT_EQ(url.toString(), "https://example.com/path?a=1&b=x%20y");
}

TEST_F(CurlUrlSearchParamsTest, UrlHandleRejectsRelativeUrl)
{
	CurlUrlHandle url;
	EXPECT_THROW(url.setUrl("not a url"), std::invalid_argument);
}

TEST_F(CurlUrlSearchParamsTest, SlistHandleAppendsAndMoves)
{
	CurlSlistHandle headers;
	EXPECT_EQ(headers.get(), nullptr);

	headers.appendBearerAuthorization("token");
	headers.append("Content-Type: application/json");
	ASSERT_NE(headers.get(), nullptr);
	EXPECT_STREQ(headers.get()->data, "Authorization: Bearer token");
	ASSERT_NE(headers.get()->next, nullptr);
	EXPECT_STREQ(headers.get()->next->data, "Content-Type: application/json");

	CurlSlistHandle moved(std::move(headers));
	EXPECT_EQ(headers.get(), nullptr);
	EXPECT_NE(moved.get(), nullptr);
}

TEST(CurlStringWriteCallbackTest, AppendsChunks)
{
	std::string body;
	char first[] = "hello ";
	char second[] = "world";

	EXPECT_EQ(CurlStringWriteCallback(first, 1, 6, &body), 6u);
	EXPECT_EQ(CurlStringWriteCallback(second, 1, 5, &body), 5u);
	EXPECT_EQ(body, "hello world");
}

TEST(CurlStringWriteCallbackTest, RejectsOversizedBody)
{
	std::string body(kMaxResponseBodyBytes, 'x');
	char chunk[] = "y";

	EXPECT_EQ(CurlStringWriteCallback(chunk, 1, 1, &body), CURL_WRITEFUNC_ERROR);
	EXPECT_EQ(body.size(), kMaxResponseBodyBytes);
}
