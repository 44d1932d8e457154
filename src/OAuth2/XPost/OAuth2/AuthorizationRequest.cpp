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

#include "AuthorizationRequest.hpp"

#include <stdexcept>

#include <XPost/CurlHelper/CurlHandle.hpp>
#include <XPost/CurlHelper/CurlUrlHandle.hpp>
#include <XPost/CurlHelper/CurlUrlSearchParams.hpp>

namespace XPost::OAuth2 {

AuthorizationState makeAuthorizationState(const OAuth2ProviderSettings &settings)
{
	return AuthorizationState{
		.state = generateStateToken(),
		.redirect_uri = settings.redirectUri(),
		.scope = settings.scope,
	};
}

std::string buildAuthorizationUrl(const std::string &authorizationEndpoint, const std::string &clientId,
				  const AuthorizationState &authorizationState, const std::string &codeChallenge)
{
	if (clientId.empty()) {
		throw std::invalid_argument("ClientIdIsEmptyError(buildAuthorizationUrl)");
	}
	if (authorizationState.state.empty()) {
		throw std::invalid_argument("StateIsEmptyError(buildAuthorizationUrl)");
	}
	if (codeChallenge.empty()) {
		throw std::invalid_argument("CodeChallengeIsEmptyError(buildAuthorizationUrl)");
	}

	CurlHelper::CurlHandle curl;
	CurlHelper::CurlUrlSearchParams params(curl.getRaw());
	params.append("response_type", "code");
	params.append("client_id", clientId);
	params.append("redirect_uri", authorizationState.redirect_uri);
	params.append("scope", authorizationState.scope);
	params.append("state", authorizationState.state);
	params.append("code_challenge", codeChallenge);
	params.append("code_challenge_method", "S256");

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(authorizationEndpoint);
	urlHandle.appendQuery(params.toString());
	return urlHandle.toString();
}

} // namespace XPost::OAuth2
