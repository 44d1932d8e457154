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

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <XPost/Logger/ILogger.hpp>
#include <XPost/OAuth2/OAuth2ClientCredentials.hpp>

namespace XPost::Cli {

struct AppConfig {
	OAuth2::OAuth2ProviderSettings provider;
	std::string api_base_url = "https://api.x.com/2";
	std::string media_upload_url = "https://upload.twitter.com/1.1/media/upload.json";
	// 0 waits for the browser redirect without a bound.
	int callback_timeout_seconds = 0;
	std::string log_level = "warn";

	[[nodiscard]]
	std::chrono::milliseconds callbackTimeout() const
	{
		return std::chrono::seconds(callback_timeout_seconds);
	}

	// $XPOST_SETTINGS, or settings.json beside the credential file.
	[[nodiscard]]
	static std::filesystem::path defaultPath();

	// Falls back to the defaults, with a log entry, when the file is missing or unusable.
	[[nodiscard]]
	static AppConfig load(const std::filesystem::path &path, const Logger::ILogger &logger);
};

void from_json(const nlohmann::json &j, AppConfig &p);

} // namespace XPost::Cli
