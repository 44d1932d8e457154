/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost Cli Library
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

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include <XPost/Logger/ILogger.hpp>
#include <XPost/OAuth2/IOAuth2Client.hpp>
#include <XPost/OAuth2/OAuth2ClientCredentials.hpp>
#include <XPost/OAuth2/TokenLifecycleManager.hpp>
#include <XPost/Store/ICredentialStore.hpp>
#include <XPost/Store/PromptIfMissing.hpp>
#include <XPost/XApi/IXApiClient.hpp>
#include <XPost/XApi/OAuth1Signature.hpp>

#include "AppConfig.hpp"
#include "CliOptions.hpp"

namespace XPost::Cli {

using OAuth2ClientFactory = std::function<std::shared_ptr<OAuth2::IOAuth2Client>(
	const OAuth2::OAuth2ClientCredentials &credentials, const OAuth2::OAuth2ProviderSettings &providerSettings)>;

// `oauth1` is set only when an image is to be uploaded.
using XApiClientFactory = std::function<std::shared_ptr<XApi::IXApiClient>(
	const std::string &accessToken, const std::optional<XApi::OAuth1Credentials> &oauth1)>;

struct CliDependencies {
	std::shared_ptr<Store::ICredentialStore> store;
	OAuth2ClientFactory makeOAuth2Client;
	XApiClientFactory makeXApiClient;
	std::shared_ptr<OAuth2::OAuth2UserAgent> userAgent;
	Store::PromptFunction prompt;
	std::shared_ptr<const Logger::ILogger> logger;
};

/**
 * The x-post command: resolve credentials, read the text, obtain a token and
 * publish. Every failure is reported as one line on the error stream and
 * turned into exit status 1.
 */
class CliApp {
public:
	CliApp(AppConfig config, CliDependencies dependencies, std::istream &in, std::ostream &out,
	       std::ostream &err);
	~CliApp() noexcept;

	CliApp(const CliApp &) = delete;
	CliApp &operator=(const CliApp &) = delete;
	CliApp(CliApp &&) = delete;
	CliApp &operator=(CliApp &&) = delete;

	[[nodiscard]]
	int run(const CliOptions &options);

private:
	void resetCredentials(const CliOptions &options);
	[[nodiscard]]
	std::optional<std::string> readPostText(const CliOptions &options);
	[[nodiscard]]
	std::optional<std::string> obtainAccessToken(const OAuth2::OAuth2ClientCredentials &credentials, bool force);
	[[nodiscard]]
	std::optional<XApi::OAuth1Credentials> obtainOAuth1Credentials();

	const AppConfig config_;
	const CliDependencies dependencies_;
	std::istream &in_;
	std::ostream &out_;
	std::ostream &err_;
};

} // namespace XPost::Cli
