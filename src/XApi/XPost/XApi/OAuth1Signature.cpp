/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost XApi Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "OAuth1Signature.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace XPost::XApi {

namespace {

// RFC 3986 unreserved characters pass through; everything else becomes %XX.
std::string percentEncode(CURL *curl, std::string_view s)
{
	std::unique_ptr<char, decltype(&curl_free)> escaped(
		curl_easy_escape(curl, s.data(), static_cast<int>(s.length())), curl_free);
	if (!escaped) {
		throw std::runtime_error("EncodeError(OAuth1Signature::percentEncode)");
	}
	return std::string(escaped.get());
}

std::string base64Encode(const unsigned char *data, std::size_t size)
{
	std::string encoded(4 * ((size + 2) / 3) + 1, '\0');
	const int length =
		EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()), data, static_cast<int>(size));
	if (length < 0) {
		throw std::runtime_error("Base64EncodeError(OAuth1Signature::base64Encode)");
	}
	encoded.resize(static_cast<std::size_t>(length));
	return encoded;
}

} // anonymous namespace

std::string computeOAuth1Signature(CURL *curl, std::string_view method, std::string_view baseUrl,
				   const OAuth1Parameters &parameters, std::string_view consumerSecret,
				   std::string_view tokenSecret)
{
	if (!curl) {
		throw std::invalid_argument("CurlIsNullError(computeOAuth1Signature)");
	}

	OAuth1Parameters encoded;
	encoded.reserve(parameters.size());
	for (const auto &[name, value] : parameters) {
		encoded.emplace_back(percentEncode(curl, name), percentEncode(curl, value));
	}
	std::sort(encoded.begin(), encoded.end());

	std::string parameterString;
	for (const auto &[name, value] : encoded) {
		if (!parameterString.empty()) {
			parameterString += '&';
		}
		parameterString += name;
		parameterString += '=';
		parameterString += value;
	}

	const std::string baseString = fmt::format("{}&{}&{}", method, percentEncode(curl, baseUrl),
						   percentEncode(curl, parameterString));
	const std::string signingKey =
		fmt::format("{}&{}", percentEncode(curl, consumerSecret), percentEncode(curl, tokenSecret));

	std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
	unsigned int digestLength = 0;
	if (!HMAC(EVP_sha1(), signingKey.data(), static_cast<int>(signingKey.size()),
		  reinterpret_cast<const unsigned char *>(baseString.data()), baseString.size(), digest.data(),
		  &digestLength)) {
		throw std::runtime_error("HmacError(computeOAuth1Signature)");
	}

	return base64Encode(digest.data(), digestLength);
}

std::string buildOAuth1AuthorizationHeader(CURL *curl, std::string_view method, std::string_view baseUrl,
					   const OAuth1Credentials &credentials,
					   const OAuth1Parameters &requestParameters, std::string_view nonce,
					   std::int64_t timestamp)
{
	OAuth1Parameters oauthParameters{
		{"oauth_consumer_key", credentials.api_key},
		{"oauth_nonce", std::string(nonce)},
		{"oauth_signature_method", "HMAC-SHA1"},
		{"oauth_timestamp", std::to_string(timestamp)},
		{"oauth_token", credentials.access_token},
		{"oauth_version", "1.0"},
	};

	OAuth1Parameters allParameters = requestParameters;
	allParameters.insert(allParameters.end(), oauthParameters.begin(), oauthParameters.end());

	const std::string signature = computeOAuth1Signature(curl, method, baseUrl, allParameters, credentials.api_key_secret,
							     credentials.access_token_secret);
	oauthParameters.emplace_back("oauth_signature", signature);
	std::sort(oauthParameters.begin(), oauthParameters.end());

	std::string header = "Authorization: OAuth ";
	for (std::size_t i = 0; i < oauthParameters.size(); i++) {
		if (i > 0) {
			header += ", ";
		}
		header += fmt::format("{}=\"{}\"", oauthParameters[i].first, percentEncode(curl, oauthParameters[i].second));
	}
	return header;
}

std::string generateOAuth1Nonce()
{
	std::array<unsigned char, 16> buffer{};
	if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
		throw std::runtime_error("RandomBytesError(generateOAuth1Nonce)");
	}

	std::string nonce;
	nonce.reserve(buffer.size() * 2);
	for (unsigned char byte : buffer) {
		nonce += fmt::format("{:02x}", byte);
	}
	return nonce;
}

} // namespace XPost::XApi
