/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <XPost/CurlHelper/CurlHandle.hpp>
#include <XPost/CurlHelper/CurlUrlHandle.hpp>
#include <XPost/CurlHelper/CurlUrlSearchParams.hpp>
#include <XPost/OAuth2/AuthorizationRequest.hpp>

using namespace XPost;
using namespace XPost::OAuth2;

class AuthorizationRequestTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }
};

TEST_F(AuthorizationRequestTest, StateUsesProviderSettings)
{
	OAuth2ProviderSettings settings;
	const AuthorizationState state = makeAuthorizationState(settings);

	EXPECT_EQ(state.redirect_uri, "http://localhost:8000/callback");
	EXPECT_EQ(state.scope, "tweet.write tweet.read users.read offline.access");
	EXPECT_EQ(state.state.size(), 22u);
	EXPECT_NE(state.state, makeAuthorizationState(settings).state);
}

TEST_F(AuthorizationRequestTest, UrlCarriesEveryParameter)
{
	const AuthorizationState state{
		.state = "xyz-state",
		.redirect_uri = "http://localhost:8000/callback",
		.scope = "tweet.write tweet.read users.read offline.access",
	};

	const std::string url =
		buildAuthorizationUrl("https://twitter.com/i/oauth2/authorize", "client-123", state, "challenge_abc");

	EXPECT_EQ(url.rfind("https://twitter.com/i/oauth2/authorize?", 0), 0u);

	CurlHelper::CurlUrlHandle handle;
	handle.setUrl(url);
	CurlHelper::CurlHandle curl;
	CurlHelper::CurlUrlSearchParams params(curl.getRaw());
	params.parse(handle.query());

	EXPECT_EQ(params.size(), 7u);
	EXPECT_EQ(params.get("response_type"), "code");
	EXPECT_EQ(params.get("client_id"), "client-123");
	EXPECT_EQ(params.get("redirect_uri"), "http://localhost:8000/callback");
	EXPECT_EQ(params.get("scope"), "tweet.write tweet.read users.read offline.access");
	EXPECT_EQ(params.get("state"), "xyz-state");
	EXPECT_EQ(params.get("code_challenge"), "challenge_abc");
	EXPECT_EQ(params.get("code_challenge_method"), "S256");
}

TEST_F(AuthorizationRequestTest, ValuesArePercentEncoded)
{
	const AuthorizationState state{.state = "s", .redirect_uri = "http://localhost:8000/callback", .scope = "a b"};

	const std::string url = buildAuthorizationUrl("https://twitter.com/i/oauth2/authorize", "id&x=1", state, "c");

	EXPECT_NE(url.find("client_id=id%26x%3D1"), std::string::npos);
	EXPECT_NE(url.find("scope=a%20b"), std::string::npos);
	EXPECT_NE(url.find("redirect_uri=http%3A%2F%2Flocalhost%3A8000%2Fcallback"), std::string::npos);
}

TEST_F(AuthorizationRequestTest, EmptyInputsAreRejected)
{
	const AuthorizationState state{.state = "s", .redirect_uri = "http://localhost:8000/callback", .scope = "x"};
	const AuthorizationState noState{.state = "", .redirect_uri = "http://localhost:8000/callback", .scope = "x"};
	const std::string endpoint = "https://twitter.com/i/oauth2/authorize";

	EXPECT_THROW((void)buildAuthorizationUrl(endpoint, "", state, "c"), std::invalid_argument);
	EXPECT_THROW((void)buildAuthorizationUrl(endpoint, "id", noState, "c"), std::invalid_argument);
	EXPECT_THROW((void)buildAuthorizationUrl(endpoint, "id", state, ""), std::invalid_argument);
	EXPECT_THROW((void)buildAuthorizationUrl("not a url", "id", state, "c"), std::invalid_argument);
}
