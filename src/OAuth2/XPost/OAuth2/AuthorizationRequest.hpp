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

#include "OAuth2ClientCredentials.hpp"
#include "Pkce.hpp"

namespace XPost::OAuth2 {

// Lives for the duration of one authorization attempt only.
struct AuthorizationState {
	std::string state;
	std::string redirect_uri;
	std::string scope;
};

[[nodiscard]]
AuthorizationState makeAuthorizationState(const OAuth2ProviderSettings &settings);

/**
 * Composes the consent URL the user opens in a browser.
 *
 * Carries response_type=code, client_id, redirect_uri, scope, state,
 * code_challenge and code_challenge_method=S256, percent-encoded.
 */
[[nodiscard]]
std::string buildAuthorizationUrl(const std::string &authorizationEndpoint, const std::string &clientId,
				  const AuthorizationState &authorizationState, const std::string &codeChallenge);

} // namespace XPost::OAuth2
