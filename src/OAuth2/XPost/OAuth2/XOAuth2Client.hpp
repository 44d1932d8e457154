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

#include <memory>
#include <string>

#include <XPost/CurlHelper/CurlHandle.hpp>
#include <XPost/CurlHelper/CurlUrlSearchParams.hpp>
#include <XPost/Logger/ILogger.hpp>

#include "IOAuth2Client.hpp"
#include "OAuth2ClientCredentials.hpp"

namespace XPost::OAuth2 {

class XOAuth2Client final : public IOAuth2Client {
public:
	XOAuth2Client(OAuth2ClientCredentials clientCredentials, OAuth2ProviderSettings providerSettings,
		      std::shared_ptr<const Logger::ILogger> logger);

	~XOAuth2Client() noexcept override;

	bool isTokenValid(const std::string &accessToken) override;

	TokenPair exchangeCode(const std::string &code, const std::string &codeVerifier,
			       const std::string &redirectUri) override;

	TokenPair refresh(const std::string &refreshToken) override;

private:
	TokenPair requestToken(const CurlHelper::CurlUrlSearchParams &params, const char *grantType);

	const OAuth2ClientCredentials clientCredentials_;
	const OAuth2ProviderSettings providerSettings_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const CurlHelper::CurlHandle curl_;
};

} // namespace XPost::OAuth2
