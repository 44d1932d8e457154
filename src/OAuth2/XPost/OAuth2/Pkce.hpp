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

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace XPost::OAuth2 {

struct PkcePair {
	std::string verifier;
	std::string challenge;
};

inline constexpr std::size_t kPkceVerifierEntropyBytes = 32;
inline constexpr std::size_t kStateTokenEntropyBytes = 16;

/**
 * Generates a fresh verifier and its S256 challenge (RFC 7636).
 *
 * The verifier is 32 bytes from the OpenSSL CSPRNG, base64url-encoded
 * without padding, which yields 43 characters.
 */
[[nodiscard]]
PkcePair generatePkcePair();

// base64url(SHA-256(verifier)), no padding.
[[nodiscard]]
std::string deriveCodeChallenge(std::string_view verifier);

// Anti-CSRF token round-tripped through the authorization redirect.
[[nodiscard]]
std::string generateStateToken();

[[nodiscard]]
std::string base64UrlEncode(std::span<const unsigned char> data);

} // namespace XPost::OAuth2
