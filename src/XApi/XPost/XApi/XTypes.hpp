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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace XPost::XApi {

struct XUser {
	std::string id;
	std::string name;
	std::string username;
};

void from_json(const nlohmann::json &j, XUser &p);

struct XPostDraft {
	std::string text;
	std::optional<std::string> in_reply_to_post_id;
	std::vector<std::string> media_ids;
};

void to_json(nlohmann::json &j, const XPostDraft &p);

struct XCreatedPost {
	std::string id;
	std::string text;
};

void from_json(const nlohmann::json &j, XCreatedPost &p);

// Answer of the v1.1 media upload endpoint.
struct XUploadedMedia {
	std::string media_id;
};

void from_json(const nlohmann::json &j, XUploadedMedia &p);

struct PostResult {
	std::string id;
	std::string url;
};

} // namespace XPost::XApi
