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

#include "XOAuth2Client.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <XPost/CurlHelper/CurlSlistHandle.hpp>
#include <XPost/CurlHelper/CurlWriteCallback.hpp>

#include "OAuth2Errors.hpp"

namespace XPost::OAuth2 {

namespace {

constexpr long kConnectTimeoutSeconds = 10L;
constexpr long kValidityCheckTimeoutSeconds = 10L;
constexpr long kTokenRequestTimeoutSeconds = 30L;

std::string describeProviderError(const nlohmann::json &j)
{
	if (!j.is_object()) {
		return {};
	}
	auto it = j.find("error");
	if (it == j.end() || it->is_null()) {
		return {};
	}
	return it->is_string() ? it->get<std::string>() : it->dump();
}

} // anonymous namespace

XOAuth2Client::XOAuth2Client(OAuth2ClientCredentials clientCredentials, OAuth2ProviderSettings providerSettings,
			     std::shared_ptr<const Logger::ILogger> logger)
	: clientCredentials_(std::move(clientCredentials)),
	  providerSettings_(std::move(providerSettings)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(XOAuth2Client)"))
{
	if (clientCredentials_.client_id.empty()) {
		throw std::invalid_argument("ClientIdIsEmptyError(XOAuth2Client)");
	}
}

XOAuth2Client::~XOAuth2Client() noexcept = default;

bool XOAuth2Client::isTokenValid(const std::string &accessToken)
{
	if (accessToken.empty()) {
		return false;
	}

	CurlHelper::CurlSlistHandle headers;
	headers.appendBearerAuthorization(accessToken);

	std::string responseBody;

	CURL *curl = curl_.resetAndGetRaw();
	curl_easy_setopt(curl, CURLOPT_URL, providerSettings_.userinfo_endpoint.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
	curl_.setTimeouts(kConnectTimeoutSeconds, kValidityCheckTimeoutSeconds);

	const CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK) {
		logger_->error("CurlPerformError", {{"error", curl_easy_strerror(res)}});
		throw TransportError(
			fmt::format("CurlPerformError(XOAuth2Client::isTokenValid): {}", curl_easy_strerror(res)));
	}

	const long httpStatus = curl_.responseCode();
	logger_->debug("TokenValidityChecked", {{"status", std::to_string(httpStatus)}});
	return httpStatus == 200;
}

TokenPair XOAuth2Client::exchangeCode(const std::string &code, const std::string &codeVerifier,
				      const std::string &redirectUri)
{
	if (code.empty()) {
		throw std::invalid_argument("CodeIsEmptyError(XOAuth2Client::exchangeCode)");
	}
	if (codeVerifier.empty()) {
		throw std::invalid_argument("CodeVerifierIsEmptyError(XOAuth2Client::exchangeCode)");
	}

	CurlHelper::CurlUrlSearchParams params(curl_.getRaw());
	params.append("grant_type", "authorization_code");
	params.append("code", code);
	params.append("redirect_uri", redirectUri);
	params.append("code_verifier", codeVerifier);
	params.append("client_id", clientCredentials_.client_id);

	logger_->info("TokenExchanging");
	TokenPair tokens = requestToken(params, "authorization_code");
	logger_->info("TokenExchanged");
	return tokens;
}

TokenPair XOAuth2Client::refresh(const std::string &refreshToken)
{
	if (refreshToken.empty()) {
		throw std::invalid_argument("RefreshTokenIsEmptyError(XOAuth2Client::refresh)");
	}

	CurlHelper::CurlUrlSearchParams params(curl_.getRaw());
	params.append("grant_type", "refresh_token");
	params.append("refresh_token", refreshToken);
	params.append("client_id", clientCredentials_.client_id);

	logger_->info("TokenRefreshing");
	TokenPair tokens = requestToken(params, "refresh_token");
	logger_->info("TokenRefreshed");
	return tokens;
}

TokenPair XOAuth2Client::requestToken(const CurlHelper::CurlUrlSearchParams &params, const char *grantType)
{
	const std::string postData = params.toString();

	std::string responseBody;

	CURL *curl = curl_.resetAndGetRaw();
	curl_easy_setopt(curl, CURLOPT_URL, providerSettings_.token_endpoint.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.length()));

	curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
	curl_easy_setopt(curl, CURLOPT_USERNAME, clientCredentials_.client_id.c_str());
	curl_easy_setopt(curl, CURLOPT_PASSWORD, clientCredentials_.client_secret.c_str());

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
	curl_.setTimeouts(kConnectTimeoutSeconds, kTokenRequestTimeoutSeconds);

	const CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK) {
		logger_->error("CurlPerformError", {{"grantType", grantType}, {"error", curl_easy_strerror(res)}});
		throw TransportError(
			fmt::format("CurlPerformError(XOAuth2Client::requestToken): {}", curl_easy_strerror(res)));
	}

	const long httpStatus = curl_.responseCode();
	const nlohmann::json j = nlohmann::json::parse(responseBody, nullptr, false);
	const std::string providerError = describeProviderError(j);

	if (httpStatus < 200 || httpStatus >= 300 || !providerError.empty()) {
		logger_->error("TokenRequestRejected", {{"grantType", grantType},
							{"status", std::to_string(httpStatus)},
							{"error", providerError}});
		throw CredentialRejectedError(fmt::format("CredentialRejectedError(XOAuth2Client::requestToken): "
							  "HTTP {} {}",
							  httpStatus, providerError),
					      httpStatus, providerError);
	}

	if (j.is_discarded() || !j.is_object()) {
		logger_->error("MalformedTokenResponse", {{"grantType", grantType}});
		throw TransportError("MalformedTokenResponseError(XOAuth2Client::requestToken)");
	}

	try {
		return toTokenPair(j.get<TokenResponse>());
	} catch (const nlohmann::json::exception &e) {
		logger_->error("MalformedTokenResponse", {{"grantType", grantType}, {"exception", e.what()}});
		throw TransportError(fmt::format("MalformedTokenResponseError(XOAuth2Client::requestToken): {}",
						 e.what()));
	}
}

} // namespace XPost::OAuth2
