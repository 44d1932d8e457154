/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost CurlHelper Library
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

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace XPost::CurlHelper {

/**
 * Ordered list of name/value pairs rendered as an
 * application/x-www-form-urlencoded string.
 *
 * Used both for URL query strings and for POST bodies. Parsing accepts '+'
 * as an encoded space, as browsers and form encoders produce it.
 */
class CurlUrlSearchParams {
public:
	explicit CurlUrlSearchParams(CURL *curl)
		: curl_(curl ? curl : throw std::invalid_argument("CurlIsNullError(CurlUrlSearchParams)"))
	{
	}

	~CurlUrlSearchParams() noexcept = default;

	CurlUrlSearchParams(const CurlUrlSearchParams &) = delete;
	CurlUrlSearchParams &operator=(const CurlUrlSearchParams &) = delete;

	void append(std::string name, std::string value) { params_.emplace_back(std::move(name), std::move(value)); }

	[[nodiscard]]
	std::optional<std::string> get(std::string_view name) const
	{
		for (const auto &[key, value] : params_) {
			if (key == name)
				return value;
		}
		return std::nullopt;
	}

	[[nodiscard]]
	std::size_t size() const noexcept
	{
		return params_.size();
	}

	[[nodiscard]]
	std::string toString() const
	{
		std::ostringstream oss;
		for (std::size_t i = 0; i < params_.size(); i++) {
			if (i > 0) {
				oss << "&";
			}
			oss << escape(params_[i].first) << "=" << escape(params_[i].second);
		}
		return oss.str();
	}

	void parse(std::string_view query)
	{
		std::size_t pos = 0;
		while (pos <= query.size()) {
			std::size_t end = query.find('&', pos);
			if (end == std::string_view::npos)
				end = query.size();

			std::string_view pair = query.substr(pos, end - pos);
			if (!pair.empty()) {
				std::size_t eq = pair.find('=');
				if (eq == std::string_view::npos) {
					append(unescape(pair), "");
				} else {
					append(unescape(pair.substr(0, eq)), unescape(pair.substr(eq + 1)));
				}
			}
			pos = end + 1;
		}
	}

private:
	[[nodiscard]]
	std::string escape(const std::string &s) const
	{
		std::unique_ptr<char, decltype(&curl_free)> escaped(
			curl_easy_escape(curl_, s.c_str(), static_cast<int>(s.length())), curl_free);
		if (!escaped) {
			throw std::runtime_error("EncodeError(CurlUrlSearchParams::escape)");
		}
		return std::string(escaped.get());
	}

	[[nodiscard]]
	std::string unescape(std::string_view s) const
	{
		std::string plus(s);
		for (char &c : plus) {
			if (c == '+')
				c = ' ';
		}

		int length = 0;
		std::unique_ptr<char, decltype(&curl_free)> unescaped(
			curl_easy_unescape(curl_, plus.c_str(), static_cast<int>(plus.length()), &length), curl_free);
		if (!unescaped) {
			throw std::runtime_error("DecodeError(CurlUrlSearchParams::unescape)");
		}
		return std::string(unescaped.get(), static_cast<std::size_t>(length));
	}

	CURL *const curl_;
	std::vector<std::pair<std::string, std::string>> params_;
};

} // namespace XPost::CurlHelper
