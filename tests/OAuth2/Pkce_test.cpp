/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <array>
#include <set>
#include <string>

#include <XPost/OAuth2/Pkce.hpp>

using namespace XPost::OAuth2;

namespace {

bool isBase64UrlAlphabet(const std::string &s)
{
	for (char c : s) {
		const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
				c == '_';
		if (!ok)
			return false;
	}
	return true;
}

} // anonymous namespace

TEST(PkceTest, ChallengeMatchesRfc7636AppendixB)
{
	EXPECT_EQ(deriveCodeChallenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
		  "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(PkceTest, GeneratedPairIsConsistent)
{
	const PkcePair pair = generatePkcePair();

	EXPECT_EQ(pair.verifier.size(), 43u);
	EXPECT_TRUE(isBase64UrlAlphabet(pair.verifier));
	EXPECT_EQ(pair.challenge.size(), 43u);
	EXPECT_TRUE(isBase64UrlAlphabet(pair.challenge));
	EXPECT_EQ(pair.challenge, deriveCodeChallenge(pair.verifier));
}

TEST(PkceTest, VerifiersAreNotRepeated)
{
	std::set<std::string> verifiers;
	for (int i = 0; i < 64; i++) {
		verifiers.insert(generatePkcePair().verifier);
	}
	EXPECT_EQ(verifiers.size(), 64u);
}

TEST(PkceTest, StateTokenCarriesSixteenBytes)
{
	const std::string state = generateStateToken();

	EXPECT_EQ(state.size(), 22u);
	EXPECT_TRUE(isBase64UrlAlphabet(state));
	EXPECT_NE(state, generateStateToken());
}

TEST(PkceTest, Base64UrlEncodeHasNoPadding)
{
	const std::array<unsigned char, 1> one{0xFB};
	const std::array<unsigned char, 2> two{0xFF, 0xFF};
	const std::array<unsigned char, 3> three{'f', 'o', 'o'};

	EXPECT_EQ(base64UrlEncode(one), "-w");
	EXPECT_EQ(base64UrlEncode(two), "__8");
	EXPECT_EQ(base64UrlEncode(three), "Zm9v");
	EXPECT_EQ(base64UrlEncode({}), "");
}
