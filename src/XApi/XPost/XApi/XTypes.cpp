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

#include "XTypes.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace XPost::XApi {

void from_json(const nlohmann::json &j, XUser &p)
{
	j.at("id").get_to(p.id);
	j.at("username").get_to(p.username);

	if (auto it = j.find("name"); it != j.end() && !it->is_null()) {
		it->get_to(p.name);
	} else {
		p.name.clear();
	}
}

void to_json(nlohmann::json &j, const XPostDraft &p)
{
	j = nlohmann::json{{"text", p.text}};

	if (p.in_reply_to_post_id.has_value()) {
		j["reply"] = {{"in_reply_to_tweet_id", *p.in_reply_to_post_id}};
	}
	if (!p.media_ids.empty()) {
		j["media"] = {{"media_ids", p.media_ids}};
	}
}

void from_json(const nlohmann::json &j, XCreatedPost &p)
{
	j.at("id").get_to(p.id);

	if (auto it = j.find("text"); it != j.end() && !it->is_null()) {
		it->get_to(p.text);
	} else {
		p.text.clear();
	}
}

void from_json(const nlohmann::json &j, XUploadedMedia &p)
{
	if (auto it = j.find("media_id_string"); it != j.end() && it->is_string()) {
		it->get_to(p.media_id);
		return;
	}

	const nlohmann::json &id = j.at("media_id");
	p.media_id = id.is_string() ? id.get<std::string>() : std::to_string(id.get<std::uint64_t>());
}

} // namespace XPost::XApi
