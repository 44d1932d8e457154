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

#include "PostText.hpp"

#include <cctype>
#include <string>

namespace XPost::XApi {

namespace {

constexpr char32_t kReplacementCharacter = 0xFFFD;

// Decodes one code point starting at `pos` and advances `pos` past it.
char32_t decodeUtf8(std::string_view text, std::size_t &pos) noexcept
{
	const auto lead = static_cast<unsigned char>(text[pos]);

	std::size_t length;
	char32_t codePoint;
	if (lead < 0x80) {
		pos += 1;
		return lead;
	} else if ((lead & 0xE0) == 0xC0) {
		length = 2;
		codePoint = lead & 0x1F;
	} else if ((lead & 0xF0) == 0xE0) {
		length = 3;
		codePoint = lead & 0x0F;
	} else if ((lead & 0xF8) == 0xF0) {
		length = 4;
		codePoint = lead & 0x07;
	} else {
		pos += 1;
		return kReplacementCharacter;
	}

	if (pos + length > text.size()) {
		pos += 1;
		return kReplacementCharacter;
	}

	for (std::size_t i = 1; i < length; i++) {
		const auto continuation = static_cast<unsigned char>(text[pos + i]);
		if ((continuation & 0xC0) != 0x80) {
			pos += 1;
			return kReplacementCharacter;
		}
		codePoint = (codePoint << 6) | (continuation & 0x3F);
	}

	pos += length;
	return codePoint;
}

bool isWhitespace(char32_t c) noexcept
{
	switch (c) {
	case U'\t':
	case U'\n':
	case U'\v':
	case U'\f':
	case U'\r':
	case 0x1C:
	case 0x1D:
	case 0x1E:
	case 0x1F:
	case U' ':
	case 0x85:
	case 0xA0:
	case 0x1680:
	case 0x2028:
	case 0x2029:
	case 0x202F:
	case 0x205F:
	case 0x3000:
		return true;
	default:
		return c >= 0x2000 && c <= 0x200A;
	}
}

bool startsWithIgnoringCase(const std::u32string &text, std::size_t pos, std::string_view prefix) noexcept
{
	if (pos + prefix.size() > text.size()) {
		return false;
	}
	for (std::size_t i = 0; i < prefix.size(); i++) {
		const char32_t c = text[pos + i];
		if (c >= 0x80 || std::tolower(static_cast<unsigned char>(c)) != prefix[i]) {
			return false;
		}
	}
	return true;
}

// Length of the URL starting at `pos`, or 0 if none starts there.
std::size_t matchUrl(const std::u32string &text, std::size_t pos) noexcept
{
	std::size_t schemeLength;
	if (startsWithIgnoringCase(text, pos, "https://")) {
		schemeLength = 8;
	} else if (startsWithIgnoringCase(text, pos, "http://")) {
		schemeLength = 7;
	} else {
		return 0;
	}

	std::size_t end = pos + schemeLength;
	while (end < text.size() && !isWhitespace(text[end])) {
		end++;
	}
	return end > pos + schemeLength ? end - pos : 0;
}

} // anonymous namespace

std::size_t countPostLength(std::string_view text)
{
	std::u32string codePoints;
	codePoints.reserve(text.size());
	for (std::size_t pos = 0; pos < text.size();) {
		codePoints.push_back(decodeUtf8(text, pos));
	}

	std::size_t length = 0;
	for (std::size_t i = 0; i < codePoints.size();) {
		if (const std::size_t urlLength = matchUrl(codePoints, i); urlLength > 0) {
			length += kShortUrlLength;
			i += urlLength;
		} else {
			length++;
			i++;
		}
	}
	return length;
}

} // namespace XPost::XApi
