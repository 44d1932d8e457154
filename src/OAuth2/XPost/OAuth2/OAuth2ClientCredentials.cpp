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

#include "OAuth2ClientCredentials.hpp"

#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace XPost::OAuth2 {

std::string OAuth2ProviderSettings::redirectUri() const
{
	return fmt::format("http://{}:{}{}", redirect_host, redirect_port, callback_path);
}

void to_json(nlohmann::json &j, const OAuth2ProviderSettings &p)
{
	j = nlohmann::json{
		{"authorization_endpoint", p.authorization_endpoint},
		{"token_endpoint", p.token_endpoint},
		{"userinfo_endpoint", p.userinfo_endpoint},
		{"redirect_host", p.redirect_host},
		{"redirect_port", p.redirect_port},
		{"callback_path", p.callback_path},
		{"scope", p.scope},
	};
}

void from_json(const nlohmann::json &j, OAuth2ProviderSettings &p)
{
	const auto set_if_present = [&j](const char *key, auto &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			it->get_to(field);
		}
	};

	set_if_present("authorization_endpoint", p.authorization_endpoint);
	set_if_present("token_endpoint", p.token_endpoint);
	set_if_present("userinfo_endpoint", p.userinfo_endpoint);
	set_if_present("redirect_host", p.redirect_host);
	if (auto it = j.find("redirect_port"); it != j.end() && !it->is_null()) {
		const auto port = it->get<std::int64_t>();
		if (port < 1 || port > 65535) {
			throw std::out_of_range(fmt::format("RedirectPortOutOfRangeError(from_json):{}", port));
		}
		p.redirect_port = static_cast<std::uint16_t>(port);
	}
	set_if_present("callback_path", p.callback_path);
	set_if_present("scope", p.scope);
}

} // namespace XPost::OAuth2
