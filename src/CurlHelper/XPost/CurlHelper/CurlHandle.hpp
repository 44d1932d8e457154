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

#include <curl/curl.h>

namespace XPost::CurlHelper {

/**
 * Owns one easy handle. Clients keep a handle for their lifetime and reset it
 * before each request, so connections to the same host are reused.
 */
class CurlHandle {
public:
	CurlHandle() : curl_(curl_easy_init(), &curl_easy_cleanup)
	{
		if (!curl_) {
			throw std::runtime_error("CurlInitError(CurlHandle)");
		}
	}

	~CurlHandle() noexcept = default;

	CurlHandle(const CurlHandle &) = delete;
	CurlHandle &operator=(const CurlHandle &) = delete;
	CurlHandle(CurlHandle &&) = delete;
	CurlHandle &operator=(CurlHandle &&) = delete;

	[[nodiscard]]
	CURL *getRaw() const noexcept
	{
		return curl_.get();
	}

	// Clears every option set by a previous request while keeping the connection cache.
	CURL *resetAndGetRaw() const noexcept
	{
		curl_easy_reset(curl_.get());
		return curl_.get();
	}

	// Connect and total timeouts for the next transfer; also turns off signal use.
	void setTimeouts(long connectTimeoutSeconds, long totalTimeoutSeconds) const noexcept
	{
		curl_easy_setopt(curl_.get(), CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds);
		curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT, totalTimeoutSeconds);
		curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L);
	}

	// HTTP status of the last completed transfer, 0 if none.
	[[nodiscard]]
	long responseCode() const noexcept
	{
		long status = 0;
		curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &status);
		return status;
	}

private:
	const std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

} // namespace XPost::CurlHelper
