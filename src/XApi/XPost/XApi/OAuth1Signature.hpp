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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace XPost::XApi {

// User-context OAuth 1.0a keys. The v1.1 media endpoint accepts nothing else.
struct OAuth1Credentials {
	std::string api_key;
	std::string api_key_secret;
	std::string access_token;
	std::string access_token_secret;
};

using OAuth1Parameters = std::vector<std::pair<std::string, std::string>>;

/**
 * HMAC-SHA1 signature over the normalised request (RFC 5849 section 3.4),
 * base64-encoded.
 *
 * `parameters` holds every query, form and oauth_* parameter of the request,
 * unencoded. Multipart bodies contribute nothing.
 */
[[nodiscard]]
std::string computeOAuth1Signature(CURL *curl, std::string_view method, std::string_view baseUrl,
				   const OAuth1Parameters &parameters, std::string_view consumerSecret,
				   std::string_view tokenSecret);

/**
 * Builds the complete "Authorization: OAuth ..." header line.
 *
 * @param requestParameters Query or form parameters that take part in the signature.
 */
[[nodiscard]]
std::string buildOAuth1AuthorizationHeader(CURL *curl, std::string_view method, std::string_view baseUrl,
					   const OAuth1Credentials &credentials,
					   const OAuth1Parameters &requestParameters, std::string_view nonce,
					   std::int64_t timestamp);

// 32 hex characters from the OpenSSL CSPRNG.
[[nodiscard]]
std::string generateOAuth1Nonce();

} // namespace XPost::XApi
