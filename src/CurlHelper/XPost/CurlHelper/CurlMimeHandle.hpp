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

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace XPost::CurlHelper {

/**
 * Owns a multipart/form-data body bound to one easy handle.
 *
 * The handle passed in must outlive this object and the transfer that uses it.
 */
class CurlMimeHandle {
public:
	explicit CurlMimeHandle(CURL *curl) : mime_(curl ? curl_mime_init(curl) : nullptr, &curl_mime_free)
	{
		if (!mime_) {
			throw std::runtime_error("MimeInitError(CurlMimeHandle)");
		}
	}

	~CurlMimeHandle() noexcept = default;

	CurlMimeHandle(const CurlMimeHandle &) = delete;
	CurlMimeHandle &operator=(const CurlMimeHandle &) = delete;
	CurlMimeHandle(CurlMimeHandle &&) = delete;
	CurlMimeHandle &operator=(CurlMimeHandle &&) = delete;

	// Adds a part whose content is streamed from `path` at transfer time.
	void addFile(const std::string &name, const std::filesystem::path &path, const std::string &contentType)
	{
		curl_mimepart *part = curl_mime_addpart(mime_.get());
		if (!part) {
			throw std::runtime_error("MimeAddPartError(CurlMimeHandle::addFile)");
		}
		if (curl_mime_name(part, name.c_str()) != CURLE_OK) {
			throw std::runtime_error("MimeNameError(CurlMimeHandle::addFile)");
		}
		if (curl_mime_filedata(part, path.string().c_str()) != CURLE_OK) {
			throw std::runtime_error("MimeFileDataError(CurlMimeHandle::addFile)");
		}
		if (curl_mime_type(part, contentType.c_str()) != CURLE_OK) {
			throw std::runtime_error("MimeTypeError(CurlMimeHandle::addFile)");
		}
	}

	[[nodiscard]]
	curl_mime *get() const noexcept
	{
		return mime_.get();
	}

private:
	const std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime_;
};

} // namespace XPost::CurlHelper
