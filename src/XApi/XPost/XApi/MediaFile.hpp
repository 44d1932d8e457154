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

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace XPost::XApi {

inline constexpr std::uintmax_t kMaxMediaBytes = 5 * 1024 * 1024;

// The file cannot be attached. what() is a complete sentence for the user.
class MediaRejectedError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

struct MediaFile {
	std::filesystem::path path;
	std::string contentType;
	std::uintmax_t size = 0;
};

/**
 * Checks that `path` names an image the media endpoint accepts:
 * jpg, jpeg, png, gif or webp (extension compared case-insensitively),
 * at most kMaxMediaBytes.
 *
 * @throws MediaRejectedError otherwise.
 */
[[nodiscard]]
MediaFile inspectMediaFile(const std::filesystem::path &path);

} // namespace XPost::XApi
