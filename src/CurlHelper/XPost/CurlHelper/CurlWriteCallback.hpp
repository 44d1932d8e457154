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
#include <limits>
#include <string>

#include <curl/curl.h>

namespace XPost::CurlHelper {

// Upper bound for a buffered response body. Token and post responses are a few hundred bytes.
inline constexpr std::size_t kMaxResponseBodyBytes = 1024 * 1024;

/**
 * CURLOPT_WRITEFUNCTION that appends to the std::string passed as CURLOPT_WRITEDATA.
 *
 * Aborts the transfer with CURLE_WRITE_ERROR once the body would exceed
 * kMaxResponseBodyBytes.
 */
inline std::size_t CurlStringWriteCallback(char *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	const std::size_t chunkSize = size * nmemb;
	auto *body = static_cast<std::string *>(userp);

	if (body->size() + chunkSize > kMaxResponseBodyBytes) {
		return CURL_WRITEFUNC_ERROR;
	}

	try {
		body->append(contents, chunkSize);
	} catch (...) {
		return CURL_WRITEFUNC_ERROR;
	}

	return chunkSize;
}

} // namespace XPost::CurlHelper
