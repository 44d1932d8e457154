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

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include <nlohmann/json_fwd.hpp>

#include <XPost/Logger/ILogger.hpp>

#include "ICredentialStore.hpp"

namespace XPost::Store {

/**
 * Credential store backed by a pretty-printed JSON object of strings.
 *
 * The file and its parent directories are created on first write. Every
 * write replaces the file through a temporary sibling whose mode is 0600.
 */
class JsonCredentialStore final : public ICredentialStore {
public:
	JsonCredentialStore(std::filesystem::path path, std::shared_ptr<const Logger::ILogger> logger);
	~JsonCredentialStore() noexcept override;

	// $XDG_CONFIG_HOME/x-post-cli/config.json, falling back to ~/.config.
	[[nodiscard]]
	static std::filesystem::path defaultPath();

	[[nodiscard]]
	const std::filesystem::path &path() const noexcept
	{
		return path_;
	}

	std::optional<std::string> get(std::string_view key) const override;
	void set(std::string_view key, std::string_view value) override;
	void setMany(const std::map<std::string, std::string> &items) override;
	void remove(const std::vector<std::string> &keys) override;

private:
	[[nodiscard]]
	nlohmann::json read() const;
	void write(const nlohmann::json &j) const;

	const std::filesystem::path path_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	mutable std::mutex mutex_;
};

} // namespace XPost::Store
