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

#include "MediaFile.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace XPost::XApi {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kSupportedImageTypes{{
	{".gif", "image/gif"},
	{".jpeg", "image/jpeg"},
	{".jpg", "image/jpeg"},
	{".png", "image/png"},
	{".webp", "image/webp"},
}};

char toLowerAscii(char c)
{
	return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string getLowercaseExtension(const std::filesystem::path &p)
{
	std::string ext = p.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(), toLowerAscii);
	return ext;
}

} // anonymous namespace

MediaFile inspectMediaFile(const std::filesystem::path &path)
{
	std::error_code ec;
	if (!std::filesystem::is_regular_file(path, ec)) {
		throw MediaRejectedError(fmt::format("Image not found: {}", path.string()));
	}

	const std::string ext = getLowercaseExtension(path);
	const auto it = std::find_if(kSupportedImageTypes.begin(), kSupportedImageTypes.end(),
				     [&ext](const auto &entry) { return entry.first == ext; });
	if (it == kSupportedImageTypes.end()) {
		throw MediaRejectedError(
			fmt::format("Unsupported image format '{}'. Supported: .gif, .jpeg, .jpg, .png, .webp", ext));
	}

	const std::uintmax_t size = std::filesystem::file_size(path, ec);
	if (ec) {
		throw MediaRejectedError(fmt::format("Image not found: {}", path.string()));
	}
	if (size > kMaxMediaBytes) {
		throw MediaRejectedError(fmt::format("Image too large ({:.1f} MB). Maximum: {} MB",
						     static_cast<double>(size) / 1024.0 / 1024.0,
						     kMaxMediaBytes / 1024 / 1024));
	}

	return MediaFile{.path = path, .contentType = std::string(it->second), .size = size};
}

} // namespace XPost::XApi
