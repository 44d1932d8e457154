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

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace XPost::OAuth2 {

struct AuthorizationCode {
	std::string code;
};

struct AuthorizationError {
	std::string reason;
};

struct StateMismatch {};

// Exactly one of these is produced per authorization attempt.
using CallbackOutcome = std::variant<AuthorizationCode, AuthorizationError, StateMismatch>;

struct CallbackParameters {
	std::optional<std::string> code;
	std::optional<std::string> state;
	std::optional<std::string> error;
};

/**
 * Decides what a redirect means for the attempt that expects `expectedState`.
 *
 * A missing or different state is a mismatch even when a code is present.
 * With a matching state, a code wins over an error; no code and no error
 * yields AuthorizationError{"unknown"}.
 */
[[nodiscard]]
CallbackOutcome classifyCallback(const CallbackParameters &parameters, std::string_view expectedState);

[[nodiscard]]
bool isSuccessfulOutcome(const CallbackOutcome &outcome) noexcept;

// Human-readable HTML page returned to the browser for the outcome.
[[nodiscard]]
std::string renderCallbackPage(const CallbackOutcome &outcome);

[[nodiscard]]
std::string escapeHtml(std::string_view text);

} // namespace XPost::OAuth2
