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

#include "Pkce.hpp"

#include <array>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace XPost::OAuth2 {

namespace {

std::vector<unsigned char> randomBytes(std::size_t count)
{
	std::vector<unsigned char> buffer(count);
	if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
		throw std::runtime_error("EntropyError(randomBytes)");
	}
	return buffer;
}

} // anonymous namespace

std::string base64UrlEncode(std::span<const unsigned char> data)
{
	if (data.empty()) {
		return {};
	}

	// EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
	std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
	const int length = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()), data.data(),
					   static_cast<int>(data.size()));
	if (length < 0) {
		throw std::runtime_error("EncodeError(base64UrlEncode)");
	}
	encoded.resize(static_cast<std::size_t>(length));

	while (!encoded.empty() && encoded.back() == '=') {
		encoded.pop_back();
	}
	for (char &c : encoded) {
		if (c == '+')
			c = '-';
		else if (c == '/')
			c = '_';
	}
	return encoded;
}

std::string deriveCodeChallenge(std::string_view verifier)
{
	std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
	unsigned int digestLength = 0;

	if (EVP_Digest(verifier.data(), verifier.size(), digest.data(), &digestLength, EVP_sha256(), nullptr) != 1) {
		throw std::runtime_error("DigestError(deriveCodeChallenge)");
	}

	return base64UrlEncode(std::span<const unsigned char>(digest.data(), digestLength));
}

PkcePair generatePkcePair()
{
	const std::vector<unsigned char> entropy = randomBytes(kPkceVerifierEntropyBytes);

	PkcePair pair;
	pair.verifier = base64UrlEncode(entropy);
	pair.challenge = deriveCodeChallenge(pair.verifier);
	return pair;
}

std::string generateStateToken()
{
	return base64UrlEncode(randomBytes(kStateTokenEntropyBytes));
}

} // namespace XPost::OAuth2
