/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost OAuth2 Library
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

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace XPost::OAuth2 {

// Both tokens are always persisted together.
struct TokenPair {
	std::string access_token;
	std::string refresh_token;
};

// Body of a successful token endpoint response (RFC 6749 section 5.1).
struct TokenResponse {
	std::optional<std::string> access_token;
	std::optional<std::string> refresh_token;
	std::optional<std::string> token_type;
	std::optional<std::string> scope;
	std::optional<int> expires_in;
};

void from_json(const nlohmann::json &j, TokenResponse &p);

/**
 * Extracts the token pair from a 2xx response.
 *
 * Throws TransportError when either token is missing or empty, since a
 * grant that does not yield both cannot be cached.
 */
[[nodiscard]]
TokenPair toTokenPair(const TokenResponse &response);

} // namespace XPost::OAuth2
