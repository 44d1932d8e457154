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

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <XPost/CurlHelper/CurlHandle.hpp>
#include <XPost/Logger/ILogger.hpp>

#include "IXApiClient.hpp"
#include "OAuth1Signature.hpp"
#include "XTypes.hpp"

namespace XPost::XApi {

inline constexpr std::string_view kDefaultApiBaseUrl = "https://api.x.com/2";
inline constexpr std::string_view kDefaultMediaUploadUrl = "https://upload.twitter.com/1.1/media/upload.json";

// Bearer-authenticated client for the X API v2 endpoints the CLI needs.
class XApiClient final : public IXApiClient {
public:
	XApiClient(std::string accessToken, std::string apiBaseUrl, std::shared_ptr<const Logger::ILogger> logger,
		   std::optional<OAuth1Credentials> oauth1 = std::nullopt,
		   std::string mediaUploadUrl = std::string(kDefaultMediaUploadUrl));
	~XApiClient() noexcept override;

	// GET /users/me. The answer is cached for the lifetime of the client.
	std::string getUsername() override;

	/**
	 * Uploads one image as multipart/form-data, signed with OAuth 1.0a.
	 *
	 * @return The media id to pass to createPost.
	 * @throws MediaRejectedError if the file is not an acceptable image or
	 *         no OAuth 1.0a credentials were given.
	 * @throws std::runtime_error APIError on any non-2xx status.
	 */
	std::string uploadMedia(const std::filesystem::path &imagePath) override;

	/**
	 * POST /tweets, optionally as a reply to an existing post and with
	 * previously uploaded media attached.
	 *
	 * @return The new post id and its public URL.
	 * @throws std::runtime_error APIError on any non-2xx status.
	 */
	PostResult createPost(const std::string &text, const std::optional<std::string> &replyToPostId,
			      const std::vector<std::string> &mediaIds) override;

private:
	const std::string accessToken_;
	const std::string apiBaseUrl_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::optional<OAuth1Credentials> oauth1_;
	const std::string mediaUploadUrl_;
	const CurlHelper::CurlHandle curl_;

	std::optional<std::string> username_;
};

} // namespace XPost::XApi
