/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost Store Library
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

#include "JsonCredentialStore.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace XPost::Store {

JsonCredentialStore::JsonCredentialStore(std::filesystem::path path, std::shared_ptr<const Logger::ILogger> logger)
	: path_(std::move(path)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(JsonCredentialStore)"))
{
	if (path_.empty()) {
		throw std::invalid_argument("PathIsEmptyError(JsonCredentialStore)");
	}
}

JsonCredentialStore::~JsonCredentialStore() noexcept = default;

std::filesystem::path JsonCredentialStore::defaultPath()
{
	std::filesystem::path configHome;
	if (const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
		configHome = xdgConfigHome;
	} else if (const char *home = std::getenv("HOME"); home && *home) {
		configHome = std::filesystem::path(home) / ".config";
	} else {
		throw std::runtime_error("HomeNotFoundError(JsonCredentialStore::defaultPath)");
	}
	return configHome / "x-post-cli" / "config.json";
}

std::optional<std::string> JsonCredentialStore::get(std::string_view key) const
{
	std::scoped_lock lock(mutex_);
	const nlohmann::json j = read();

	auto it = j.find(std::string(key));
	if (it == j.end() || !it->is_string()) {
		return std::nullopt;
	}
	return it->get<std::string>();
}

void JsonCredentialStore::set(std::string_view key, std::string_view value)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json j = read();
	j[std::string(key)] = std::string(value);
	write(j);
}

void JsonCredentialStore::setMany(const std::map<std::string, std::string> &items)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json j = read();
	for (const auto &[key, value] : items) {
		j[key] = value;
	}
	write(j);
}

void JsonCredentialStore::remove(const std::vector<std::string> &keys)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json j = read();
	for (const auto &key : keys) {
		j.erase(key);
	}
	write(j);
}

nlohmann::json JsonCredentialStore::read() const
{
	if (!std::filesystem::is_regular_file(path_)) {
		return nlohmann::json::object();
	}

	std::ifstream ifs(path_, std::ios::in);
	if (!ifs.is_open()) {
		logger_->error("FileOpenError", {{"path", path_.string()}});
		throw std::runtime_error("FileOpenError(JsonCredentialStore::read)");
	}

	nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		logger_->error("CredentialFileMalformed", {{"path", path_.string()}});
		throw std::runtime_error(fmt::format("CredentialFileMalformedError(JsonCredentialStore::read): {}",
						     path_.string()));
	}
	return j;
}

void JsonCredentialStore::write(const nlohmann::json &j) const
{
	if (path_.has_parent_path()) {
		std::filesystem::create_directories(path_.parent_path());
	}

	std::filesystem::path tmpPath = path_;
	tmpPath += ".tmp";

	{
		std::ofstream ofs(tmpPath, std::ios::out | std::ios::trunc);
		if (!ofs.is_open()) {
			logger_->error("FileOpenError", {{"path", tmpPath.string()}});
			throw std::runtime_error("FileOpenError(JsonCredentialStore::write)");
		}
		std::filesystem::permissions(tmpPath,
					     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
					     std::filesystem::perm_options::replace);

		ofs << j.dump(2) << '\n';
		ofs.close();
		if (ofs.fail()) {
			logger_->error("FileWriteError", {{"path", tmpPath.string()}});
			throw std::runtime_error("FileWriteError(JsonCredentialStore::write)");
		}
	}

	std::filesystem::rename(tmpPath, path_);
	logger_->debug("CredentialFileWritten", {{"path", path_.string()}});
}

} // namespace XPost::Store
