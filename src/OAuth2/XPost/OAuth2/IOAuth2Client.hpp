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

#include <string>

#include "TokenPair.hpp"

namespace XPost::OAuth2 {

/**
 * The provider-facing half of the token lifecycle.
 *
 * Implementations throw TransportError for network failures and
 * CredentialRejectedError when the provider refuses a grant. None of them
 * retry internally.
 */
class IOAuth2Client {
public:
	IOAuth2Client() = default;
	virtual ~IOAuth2Client() = default;

	IOAuth2Client(const IOAuth2Client &) = delete;
	IOAuth2Client &operator=(const IOAuth2Client &) = delete;
	IOAuth2Client(IOAuth2Client &&) = delete;
	IOAuth2Client &operator=(IOAuth2Client &&) = delete;

	// True only when the provider answers 200 to an authenticated identity check.
	[[nodiscard]]
	virtual bool isTokenValid(const std::string &accessToken) = 0;

	[[nodiscard]]
	virtual TokenPair exchangeCode(const std::string &code, const std::string &codeVerifier,
				       const std::string &redirectUri) = 0;

	[[nodiscard]]
	virtual TokenPair refresh(const std::string &refreshToken) = 0;
};

} // namespace XPost::OAuth2
