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

#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace XPost::CurlHelper {

class CurlUrlHandle {
public:
	CurlUrlHandle() : handle_(curl_url())
	{
		if (!handle_) {
			throw std::runtime_error("InitError(CurlUrlHandle)");
		}
	}

	~CurlUrlHandle() noexcept { curl_url_cleanup(handle_); }

	CurlUrlHandle(const CurlUrlHandle &) = delete;
	CurlUrlHandle &operator=(const CurlUrlHandle &) = delete;

	void setUrl(const std::string &url)
	{
		CURLUcode uc = curl_url_set(handle_, CURLUPART_URL, url.c_str(), 0);
		if (uc != CURLUE_OK) {
			throw std::invalid_argument("URLParseError(CurlUrlHandle::setUrl):" + url);
		}
	}

	void appendQuery(const std::string &query)
	{
		CURLUcode uc = curl_url_set(handle_, CURLUPART_QUERY, query.c_str(), CURLU_APPENDQUERY);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("QueryAppendError(CurlUrlHandle::appendQuery)");
		}
	}

	[[nodiscard]]
	std::string toString() const
	{
		return getPart(CURLUPART_URL);
	}

	// Empty when the URL carries no query component.
	[[nodiscard]]
	std::string query() const
	{
		char *part = nullptr;
		CURLUcode uc = curl_url_get(handle_, CURLUPART_QUERY, &part, 0);
		if (uc == CURLUE_NO_QUERY) {
			return {};
		}
		if (uc != CURLUE_OK || !part) {
			throw std::runtime_error("GetQueryError(CurlUrlHandle::query)");
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(part, curl_free);
		return std::string(guard.get());
	}

private:
	[[nodiscard]]
	std::string getPart(CURLUPart what) const
	{
		char *part = nullptr;
		CURLUcode uc = curl_url_get(handle_, what, &part, 0);
		if (uc != CURLUE_OK || !part) {
			throw std::runtime_error("GetUrlError(CurlUrlHandle::getPart)");
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(part, curl_free);
		return std::string(guard.get());
	}

	CURLU *const handle_;
};

} // namespace XPost::CurlHelper
