/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost OAuth2 Library
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

#include "CallbackOutcome.hpp"

#include <fmt/format.h>

namespace XPost::OAuth2 {

namespace {

template<class... Ts> struct Overloaded : Ts... {
	using Ts::operator()...;
};
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string renderPage(std::string_view message)
{
	return fmt::format("<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>x-post</title></head>"
			   "<body><h2>{}</h2></body></html>",
			   escapeHtml(message));
}

} // anonymous namespace

CallbackOutcome classifyCallback(const CallbackParameters &parameters, std::string_view expectedState)
{
	if (!parameters.state.has_value() || *parameters.state != expectedState) {
		return StateMismatch{};
	}

	if (parameters.code.has_value() && !parameters.code->empty()) {
		return AuthorizationCode{*parameters.code};
	}

	if (parameters.error.has_value() && !parameters.error->empty()) {
		return AuthorizationError{*parameters.error};
	}

	return AuthorizationError{"unknown"};
}

bool isSuccessfulOutcome(const CallbackOutcome &outcome) noexcept
{
	return std::holds_alternative<AuthorizationCode>(outcome);
}

std::string renderCallbackPage(const CallbackOutcome &outcome)
{
	return std::visit(Overloaded{
				  [](const AuthorizationCode &) {
					  return renderPage("Authorization successful! You can close this tab.");
				  },
				  [](const AuthorizationError &e) {
					  return renderPage(fmt::format("Authorization failed: {}", e.reason));
				  },
				  [](const StateMismatch &) {
					  return renderPage("Authorization failed: state mismatch.");
				  },
			  },
			  outcome);
}

std::string escapeHtml(std::string_view text)
{
	std::string escaped;
	escaped.reserve(text.size());
	for (char c : text) {
		switch (c) {
		case '&':
			escaped += "&amp;";
			break;
		case '<':
			escaped += "&lt;";
			break;
		case '>':
			escaped += "&gt;";
			break;
		case '"':
			escaped += "&quot;";
			break;
		case '\'':
			escaped += "&#39;";
			break;
		default:
			escaped += c;
			break;
		}
	}
	return escaped;
}

} // namespace XPost::OAuth2
