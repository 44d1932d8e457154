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

#include "XApiClient.hpp"

#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <XPost/CurlHelper/CurlMimeHandle.hpp>
#include <XPost/CurlHelper/CurlSlistHandle.hpp>
#include <XPost/CurlHelper/CurlWriteCallback.hpp>

#include "MediaFile.hpp"

namespace XPost::XApi {

namespace {

constexpr long kConnectTimeoutSeconds = 10L;
constexpr long kRequestTimeoutSeconds = 60L;

struct HttpResponse {
	long status = 0;
	std::string body;

	[[nodiscard]]
	bool ok() const noexcept
	{
		return status >= 200 && status < 300;
	}
};

HttpResponse perform(const CurlHelper::CurlHandle &curlHandle, const std::string &url, const Logger::ILogger &logger)
{
	HttpResponse response;

	CURL *curl = curlHandle.getRaw();
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
	curlHandle.setTimeouts(kConnectTimeoutSeconds, kRequestTimeoutSeconds);

	const CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK) {
		logger.error("CurlPerformError", {{"url", url}, {"error", curl_easy_strerror(res)}});
		throw std::runtime_error(fmt::format("CurlPerformError(perform): {}", curl_easy_strerror(res)));
	}

	response.status = curlHandle.responseCode();
	return response;
}

HttpResponse doRequest(const CurlHelper::CurlHandle &curlHandle, const std::string &url, curl_slist *headers,
		       const std::string *body, const Logger::ILogger &logger)
{
	CURL *curl = curlHandle.resetAndGetRaw();
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

	if (body) {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
	} else {
		curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	}

	return perform(curlHandle, url, logger);
}

HttpResponse doMultipartPost(const CurlHelper::CurlHandle &curlHandle, const std::string &url, curl_slist *headers,
			     const CurlHelper::CurlMimeHandle &mime, const Logger::ILogger &logger)
{
	CURL *curl = curlHandle.resetAndGetRaw();
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime.get());

	return perform(curlHandle, url, logger);
}

void throwUnlessOk(const HttpResponse &response, const char *operation, const Logger::ILogger &logger)
{
	if (response.ok()) {
		return;
	}

	logger.error("APIError",
		     {{"operation", operation}, {"status", std::to_string(response.status)}, {"body", response.body}});
	throw std::runtime_error(fmt::format("APIError({}): {}: {}", operation, response.status, response.body));
}

} // anonymous namespace

XApiClient::XApiClient(std::string accessToken, std::string apiBaseUrl, std::shared_ptr<const Logger::ILogger> logger,
		       std::optional<OAuth1Credentials> oauth1, std::string mediaUploadUrl)
	: accessToken_(std::move(accessToken)),
	  apiBaseUrl_(std::move(apiBaseUrl)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(XApiClient)")),
	  oauth1_(std::move(oauth1)),
	  mediaUploadUrl_(std::move(mediaUploadUrl))
{
	if (accessToken_.empty()) {
		throw std::invalid_argument("AccessTokenIsEmptyError(XApiClient)");
	}
}

XApiClient::~XApiClient() noexcept = default;

std::string XApiClient::getUsername()
{
	if (username_.has_value()) {
		return *username_;
	}

	CurlHelper::CurlSlistHandle headers;
	headers.appendBearerAuthorization(accessToken_);

	const HttpResponse response = doRequest(curl_, fmt::format("{}/users/me", apiBaseUrl_),
						headers.get(), nullptr, *logger_);
	throwUnlessOk(response, "getUsername", *logger_);

	const nlohmann::json j = nlohmann::json::parse(response.body);
	const XUser user = j.at("data").get<XUser>();

	logger_->debug("UsernameResolved", {{"username", user.username}});
	username_ = user.username;
	return user.username;
}

std::string XApiClient::uploadMedia(const std::filesystem::path &imagePath)
{
	if (!oauth1_.has_value()) {
		logger_->error("OAuth1CredentialsMissingError");
		throw MediaRejectedError("OAuth 1.0a credentials are required for media uploads.");
	}

	const MediaFile media = inspectMediaFile(imagePath);
	logger_->info("MediaUploadStarted", {{"path", media.path.string()},
					     {"size", std::to_string(media.size)},
					     {"contentType", media.contentType}});

	CurlHelper::CurlMimeHandle mime(curl_.getRaw());
	mime.addFile("media", media.path, media.contentType);

	CurlHelper::CurlSlistHandle headers;
	headers.append(buildOAuth1AuthorizationHeader(curl_.getRaw(), "POST", mediaUploadUrl_, *oauth1_, {},
						      generateOAuth1Nonce(), static_cast<std::int64_t>(std::time(nullptr))));
	// Disables "Expect: 100-continue", which the endpoint does not need.
	headers.append("Expect:");

	const HttpResponse response = doMultipartPost(curl_, mediaUploadUrl_, headers.get(), mime, *logger_);
	throwUnlessOk(response, "uploadMedia", *logger_);

	const XUploadedMedia uploaded = nlohmann::json::parse(response.body).get<XUploadedMedia>();
	logger_->info("MediaUploaded", {{"mediaId", uploaded.media_id}});
	return uploaded.media_id;
}

PostResult XApiClient::createPost(const std::string &text, const std::optional<std::string> &replyToPostId,
				  const std::vector<std::string> &mediaIds)
{
	if (text.empty()) {
		throw std::invalid_argument("TextIsEmptyError(XApiClient::createPost)");
	}

	const XPostDraft draft{.text = text, .in_reply_to_post_id = replyToPostId, .media_ids = mediaIds};
	const std::string body = nlohmann::json(draft).dump();

	CurlHelper::CurlSlistHandle headers;
	headers.appendBearerAuthorization(accessToken_);
	headers.append("Content-Type: application/json");

	const HttpResponse response = doRequest(curl_, fmt::format("{}/tweets", apiBaseUrl_),
						headers.get(), &body, *logger_);
	throwUnlessOk(response, "createPost", *logger_);

	const nlohmann::json j = nlohmann::json::parse(response.body);
	const XCreatedPost created = j.at("data").get<XCreatedPost>();
	logger_->info("PostCreated", {{"id", created.id}});

	const std::string username = getUsername();
	return PostResult{
		.id = created.id,
		.url = fmt::format("https://x.com/{}/status/{}", username, created.id),
	};
}

} // namespace XPost::XApi
