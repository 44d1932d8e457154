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

#include "CliApp.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <XPost/OAuth2/OAuth2Errors.hpp>
#include <XPost/XApi/MediaFile.hpp>
#include <XPost/XApi/PostText.hpp>

namespace XPost::Cli {

namespace {

constexpr std::string_view kFirstTimeSetupBanner = "\n"
						   "First-time setup\n"
						   "================\n"
						   "You need OAuth 2.0 credentials from the X Developer Portal.\n"
						   "\n"
						   "1. Go to https://developer.x.com and create a project & app\n"
						   "2. In User authentication settings, enable OAuth 2.0\n"
						   "3. Set type to Native App, callback URL: {}\n"
						   "4. Copy the Client ID and Client Secret below\n"
						   "\n";

constexpr std::string_view kOAuth1SetupBanner = "\n"
						"Image upload requires OAuth 1.0a credentials\n"
						"=============================================\n"
						"In your app at https://developer.x.com:\n"
						"\n"
						"1. Go to Keys and Tokens tab\n"
						"2. Under Consumer Keys, copy API Key and API Key Secret\n"
						"3. Under Authentication Tokens, generate Access Token and Secret\n"
						"   (make sure the token has Read and Write permissions)\n"
						"\n";

} // anonymous namespace

CliApp::CliApp(AppConfig config, CliDependencies dependencies, std::istream &in, std::ostream &out,
	       std::ostream &err)
	: config_(std::move(config)),
	  dependencies_(std::move(dependencies)),
	  in_(in),
	  out_(out),
	  err_(err)
{
	if (!dependencies_.store) {
		throw std::invalid_argument("StoreIsNullError(CliApp)");
	}
	if (!dependencies_.makeOAuth2Client || !dependencies_.makeXApiClient) {
		throw std::invalid_argument("FactoryIsNullError(CliApp)");
	}
	if (!dependencies_.logger) {
		throw std::invalid_argument("LoggerIsNullError(CliApp)");
	}
}

CliApp::~CliApp() noexcept = default;

int CliApp::run(const CliOptions &options)
{
	Store::ICredentialStore &store = *dependencies_.store;

	resetCredentials(options);

	if (const auto clientId = store.get(Store::kClientIdKey); !clientId.has_value() || clientId->empty()) {
		fmt::print(out_, fmt::runtime(kFirstTimeSetupBanner), config_.provider.redirectUri());
	}

	OAuth2::OAuth2ClientCredentials credentials;
	try {
		credentials.client_id =
			Store::promptIfMissing(store, Store::kClientIdKey, "Client ID", dependencies_.prompt);
		credentials.client_secret =
			Store::promptIfMissing(store, Store::kClientSecretKey, "Client Secret", dependencies_.prompt);
	} catch (const std::invalid_argument &e) {
		dependencies_.logger->warn("CredentialPromptAborted", {{"exception", e.what()}});
		err_ << "Value required. Aborting." << std::endl;
		return 1;
	}

	const std::optional<std::string> text = readPostText(options);
	if (!text.has_value()) {
		return 1;
	}
	if (text->empty()) {
		err_ << "Empty post text, aborting." << std::endl;
		return 1;
	}

	const std::size_t postLength = XApi::countPostLength(*text);
	if (postLength > XApi::kMaxPostLength) {
		fmt::print(err_, "Post too long: {}/{} characters.\n", postLength, XApi::kMaxPostLength);
		err_.flush();
		return 1;
	}

	const std::optional<std::string> accessToken = obtainAccessToken(credentials, options.resetAuth);
	if (!accessToken.has_value()) {
		return 1;
	}

	std::optional<XApi::OAuth1Credentials> oauth1;
	if (options.image.has_value()) {
		oauth1 = obtainOAuth1Credentials();
		if (!oauth1.has_value()) {
			return 1;
		}
		if (!std::filesystem::exists(*options.image)) {
			fmt::print(err_, "Image not found: {}\n", options.image->string());
			err_.flush();
			return 1;
		}
	}

	std::shared_ptr<XApi::IXApiClient> client;
	std::vector<std::string> mediaIds;
	if (options.image.has_value()) {
		try {
			client = dependencies_.makeXApiClient(*accessToken, oauth1);
			mediaIds.push_back(client->uploadMedia(*options.image));
		} catch (const XApi::MediaRejectedError &e) {
			dependencies_.logger->error("MediaRejected", {{"exception", e.what()}});
			err_ << e.what() << std::endl;
			return 1;
		} catch (const std::exception &e) {
			dependencies_.logger->error("MediaUploadFailed", {{"exception", e.what()}});
			fmt::print(err_, "Failed to upload image: {}\n", e.what());
			err_.flush();
			return 1;
		}
	}

	XApi::PostResult result;
	try {
		if (!client) {
			client = dependencies_.makeXApiClient(*accessToken, oauth1);
		}
		result = client->createPost(*text, options.replyTo, mediaIds);
	} catch (const std::exception &e) {
		dependencies_.logger->error("PostPublishFailed", {{"exception", e.what()}});
		fmt::print(err_, "Failed to publish post: {}\n", e.what());
		err_.flush();
		return 1;
	}

	fmt::print(out_, "Post published!\n{}\n", result.url);
	fmt::print(out_, "\nTo continue this thread:\nx-post --reply-to {} \"Next post text\"\n", result.id);
	out_.flush();
	return 0;
}

void CliApp::resetCredentials(const CliOptions &options)
{
	if (options.resetKeys) {
		dependencies_.store->remove({
			std::string(Store::kClientIdKey),
			std::string(Store::kClientSecretKey),
			std::string(Store::kAccessTokenKey),
			std::string(Store::kRefreshTokenKey),
			std::string(Store::kApiKeyKey),
			std::string(Store::kApiKeySecretKey),
			std::string(Store::kOAuth1AccessTokenKey),
			std::string(Store::kOAuth1AccessTokenSecretKey),
		});
		dependencies_.logger->info("CredentialsReset");
	} else if (options.resetAuth) {
		dependencies_.store->remove({
			std::string(Store::kAccessTokenKey),
			std::string(Store::kRefreshTokenKey),
		});
		dependencies_.logger->info("TokensReset");
	}
}

std::optional<std::string> CliApp::readPostText(const CliOptions &options)
{
	if (options.text.has_value() && !options.text->empty()) {
		return *options.text;
	}

	if (options.fromFile.has_value()) {
		std::ifstream ifs(*options.fromFile, std::ios::in | std::ios::binary);
		if (!ifs.is_open()) {
			dependencies_.logger->error("FileOpenError", {{"path", options.fromFile->string()}});
			fmt::print(err_, "Cannot read file: {}\n", options.fromFile->string());
			err_.flush();
			return std::nullopt;
		}
		return Store::trimWhitespace(
			std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()));
	}

	out_ << "Enter post text (Ctrl+D to send):" << std::endl;
	return Store::trimWhitespace(std::string(std::istreambuf_iterator<char>(in_), std::istreambuf_iterator<char>()));
}

std::optional<std::string> CliApp::obtainAccessToken(const OAuth2::OAuth2ClientCredentials &credentials, bool force)
{
	const auto fail = [this](const std::string &reason) -> std::optional<std::string> {
		fmt::print(err_, "Authorization failed: {}\n", reason);
		err_.flush();
		return std::nullopt;
	};

	try {
		OAuth2::TokenLifecycleManager manager(dependencies_.makeOAuth2Client(credentials, config_.provider),
						      dependencies_.store, credentials.client_id, config_.provider,
						      dependencies_.userAgent, dependencies_.logger,
						      config_.callbackTimeout());
		return manager.getValidToken(force);
	} catch (const OAuth2::ProtocolViolationError &) {
		return fail("state mismatch.");
	} catch (const OAuth2::ProviderError &e) {
		return fail(e.reason());
	} catch (const OAuth2::AuthorizationTimeoutError &) {
		return fail("no response from the browser in time.");
	} catch (const OAuth2::ListenError &) {
		return fail(fmt::format("cannot listen on {}:{}.", config_.provider.redirect_host,
					config_.provider.redirect_port));
	} catch (const OAuth2::CredentialRejectedError &e) {
		return fail(fmt::format("token request rejected (HTTP {} {}).", e.httpStatus(), e.providerError()));
	} catch (const OAuth2::TransportError &) {
		return fail("could not reach the token endpoint.");
	} catch (const std::exception &e) {
		return fail(e.what());
	}
}

std::optional<XApi::OAuth1Credentials> CliApp::obtainOAuth1Credentials()
{
	Store::ICredentialStore &store = *dependencies_.store;

	if (const auto apiKey = store.get(Store::kApiKeyKey); !apiKey.has_value() || apiKey->empty()) {
		out_ << kOAuth1SetupBanner << std::flush;
	}

	try {
		XApi::OAuth1Credentials credentials;
		credentials.api_key = Store::promptIfMissing(store, Store::kApiKeyKey, "API Key", dependencies_.prompt);
		credentials.api_key_secret =
			Store::promptIfMissing(store, Store::kApiKeySecretKey, "API Key Secret", dependencies_.prompt);
		credentials.access_token = Store::promptIfMissing(store, Store::kOAuth1AccessTokenKey,
								  "OAuth 1.0a Access Token", dependencies_.prompt);
		credentials.access_token_secret =
			Store::promptIfMissing(store, Store::kOAuth1AccessTokenSecretKey,
					       "OAuth 1.0a Access Token Secret", dependencies_.prompt);
		return credentials;
	} catch (const std::invalid_argument &e) {
		dependencies_.logger->warn("OAuth1PromptAborted", {{"exception", e.what()}});
		err_ << "Value required. Aborting." << std::endl;
		return std::nullopt;
	}
}

} // namespace XPost::Cli
