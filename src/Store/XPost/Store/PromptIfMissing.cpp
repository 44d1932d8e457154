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

#include "PromptIfMissing.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace XPost::Store {

std::string promptIfMissing(ICredentialStore &store, std::string_view key, std::string_view displayName,
			    const PromptFunction &prompt)
{
	if (std::optional<std::string> stored = store.get(key); stored.has_value() && !stored->empty()) {
		return *stored;
	}

	if (!prompt) {
		throw std::invalid_argument("PromptIsNullError(promptIfMissing)");
	}

	const std::string value = trimWhitespace(prompt(fmt::format("{}: ", displayName)));
	if (value.empty()) {
		throw std::invalid_argument(fmt::format("ValueRequiredError(promptIfMissing): {}", key));
	}

	store.set(key, value);
	return value;
}

std::string trimWhitespace(std::string_view text)
{
	constexpr std::string_view whitespace = " \t\r\n\f\v";

	const std::size_t first = text.find_first_not_of(whitespace);
	if (first == std::string_view::npos) {
		return {};
	}
	const std::size_t last = text.find_last_not_of(whitespace);
	return std::string(text.substr(first, last - first + 1));
}

} // namespace XPost::Store
