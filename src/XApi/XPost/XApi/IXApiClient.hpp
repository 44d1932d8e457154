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
#include <optional>
#include <string>
#include <vector>

#include "XTypes.hpp"

namespace XPost::XApi {

class IXApiClient {
public:
	IXApiClient() = default;
	virtual ~IXApiClient() = default;

	IXApiClient(const IXApiClient &) = delete;
	IXApiClient &operator=(const IXApiClient &) = delete;
	IXApiClient(IXApiClient &&) = delete;
	IXApiClient &operator=(IXApiClient &&) = delete;

	[[nodiscard]]
	virtual std::string getUsername() = 0;

	[[nodiscard]]
	virtual std::string uploadMedia(const std::filesystem::path &imagePath) = 0;

	[[nodiscard]]
	virtual PostResult createPost(const std::string &text, const std::optional<std::string> &replyToPostId,
				      const std::vector<std::string> &mediaIds) = 0;
};

} // namespace XPost::XApi
