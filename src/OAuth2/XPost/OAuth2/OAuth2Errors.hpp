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

#include <stdexcept>
#include <string>
#include <utility>

namespace XPost::OAuth2 {

// Network or HTTP failure while talking to the provider.
class TransportError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// The token endpoint refused the grant: expired or reused code, verifier
// mismatch, revoked refresh token.
class CredentialRejectedError : public TransportError {
public:
	CredentialRejectedError(const std::string &message, long httpStatus, std::string providerError)
		: TransportError(message),
		  httpStatus_(httpStatus),
		  providerError_(std::move(providerError))
	{
	}

	[[nodiscard]]
	long httpStatus() const noexcept
	{
		return httpStatus_;
	}

	[[nodiscard]]
	const std::string &providerError() const noexcept
	{
		return providerError_;
	}

private:
	long httpStatus_;
	std::string providerError_;
};

// The redirect did not carry the state token generated for this attempt.
// Always fatal, never retried.
class ProtocolViolationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// The provider redirected back with an error parameter, e.g. access_denied.
class ProviderError : public std::runtime_error {
public:
	ProviderError(const std::string &message, std::string reason)
		: std::runtime_error(message),
		  reason_(std::move(reason))
	{
	}

	[[nodiscard]]
	const std::string &reason() const noexcept
	{
		return reason_;
	}

private:
	std::string reason_;
};

// The loopback redirect listener could not be bound.
class ListenError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// No redirect arrived within the configured wait.
class AuthorizationTimeoutError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace XPost::OAuth2
