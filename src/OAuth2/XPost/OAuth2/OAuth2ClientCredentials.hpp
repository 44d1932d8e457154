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

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace XPost::OAuth2 {

struct OAuth2ClientCredentials {
	std::string client_id;
	std::string client_secret;
};

struct OAuth2ProviderSettings {
	std::string authorization_endpoint = "https://twitter.com/i/oauth2/authorize";
	std::string token_endpoint = "https://api.x.com/2/oauth2/token";
	std::string userinfo_endpoint = "https://api.x.com/2/users/me";
	std::string redirect_host = "localhost";
	std::uint16_t redirect_port = 8000;
	std::string callback_path = "/callback";
	std::string scope = "tweet.write tweet.read users.read offline.access";

	// http://<redirect_host>:<redirect_port><callback_path>
	[[nodiscard]]
	std::string redirectUri() const;
};

void to_json(nlohmann::json &j, const OAuth2ProviderSettings &p);
void from_json(const nlohmann::json &j, OAuth2ProviderSettings &p);

} // namespace XPost::OAuth2
