/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost Cli Library
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

#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace XPost::Cli {

struct CliOptions {
	std::optional<std::string> text;
	std::optional<std::filesystem::path> fromFile;
	std::optional<std::string> replyTo;
	std::optional<std::filesystem::path> image;
	bool resetAuth = false;
	bool resetKeys = false;
	bool verbose = false;
	bool help = false;
};

// Malformed command line; the message is shown to the user together with the usage text.
class CliUsageError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * Parses the arguments that follow the program name.
 *
 * Accepts `--opt value` and `--opt=value`. A lone `--` ends option
 * parsing, so post text that starts with a dash can still be given.
 */
[[nodiscard]]
CliOptions parseCliOptions(std::span<const std::string_view> args);

[[nodiscard]]
std::string usageText(std::string_view programName);

} // namespace XPost::Cli
