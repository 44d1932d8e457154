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

#include "AppConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include <XPost/Store/JsonCredentialStore.hpp>

namespace XPost::Cli {

std::filesystem::path AppConfig::defaultPath()
{
	if (const char *settings = std::getenv("XPOST_SETTINGS"); settings && *settings) {
		return settings;
	}
	return Store::JsonCredentialStore::defaultPath().parent_path() / "settings.json";
}

AppConfig AppConfig::load(const std::filesystem::path &path, const Logger::ILogger &logger)
{
	AppConfig config;

	if (!std::filesystem::is_regular_file(path)) {
		logger.debug("SettingsFileNotFound", {{"path", path.string()}});
		return config;
	}

	std::ifstream ifs(path, std::ios::in);
	if (!ifs.is_open()) {
		logger.warn("SettingsFileOpenError", {{"path", path.string()}});
		return config;
	}

	try {
		const nlohmann::json j = nlohmann::json::parse(ifs);
		j.get_to(config);
		logger.info("SettingsLoaded", {{"path", path.string()}});
		return config;
	} catch (const nlohmann::json::exception &e) {
		logger.warn("SettingsFileMalformed", {{"path", path.string()}, {"exception", e.what()}});
		return AppConfig();
	} catch (const std::out_of_range &e) {
		logger.warn("SettingsValueOutOfRange", {{"path", path.string()}, {"exception", e.what()}});
		return AppConfig();
	}
}

void from_json(const nlohmann::json &j, AppConfig &p)
{
	if (auto it = j.find("provider"); it != j.end() && !it->is_null()) {
		it->get_to(p.provider);
	}
	if (auto it = j.find("api_base_url"); it != j.end() && !it->is_null()) {
		it->get_to(p.api_base_url);
	}
	if (auto it = j.find("media_upload_url"); it != j.end() && !it->is_null()) {
		it->get_to(p.media_upload_url);
	}
	if (auto it = j.find("callback_timeout_seconds"); it != j.end() && !it->is_null()) {
		it->get_to(p.callback_timeout_seconds);
	}
	if (auto it = j.find("log_level"); it != j.end() && !it->is_null()) {
		it->get_to(p.log_level);
	}
}

} // namespace XPost::Cli
