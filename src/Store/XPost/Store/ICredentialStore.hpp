/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost Store Library
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

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace XPost::Store {

inline constexpr std::string_view kClientIdKey = "client_id";
inline constexpr std::string_view kClientSecretKey = "client_secret";
inline constexpr std::string_view kAccessTokenKey = "access_token";
inline constexpr std::string_view kRefreshTokenKey = "refresh_token";

// OAuth 1.0a keys, needed only for media upload.
inline constexpr std::string_view kApiKeyKey = "api_key";
inline constexpr std::string_view kApiKeySecretKey = "api_key_secret";
inline constexpr std::string_view kOAuth1AccessTokenKey = "oauth1_access_token";
inline constexpr std::string_view kOAuth1AccessTokenSecretKey = "oauth1_access_token_secret";

/**
 * Persistent string key-value store for credentials.
 *
 * Implementations serialise their own writes. Callers treat a
 * read-decide-write sequence as intent only; there are no transactions.
 */
class ICredentialStore {
public:
	ICredentialStore() = default;
	virtual ~ICredentialStore() = default;

	ICredentialStore(const ICredentialStore &) = delete;
	ICredentialStore &operator=(const ICredentialStore &) = delete;
	ICredentialStore(ICredentialStore &&) = delete;
	ICredentialStore &operator=(ICredentialStore &&) = delete;

	[[nodiscard]]
	virtual std::optional<std::string> get(std::string_view key) const = 0;

	virtual void set(std::string_view key, std::string_view value) = 0;

	// Writes every entry in one update.
	virtual void setMany(const std::map<std::string, std::string> &items) = 0;

	// Missing keys are ignored.
	virtual void remove(const std::vector<std::string> &keys) = 0;
};

} // namespace XPost::Store
