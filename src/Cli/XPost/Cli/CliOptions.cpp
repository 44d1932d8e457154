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

#include "CliOptions.hpp"

#include <fmt/format.h>

namespace XPost::Cli {

namespace {

// Splits "--name=value" into its two halves; value is empty when there is no '='.
std::pair<std::string_view, std::optional<std::string_view>> splitOption(std::string_view arg)
{
	const std::size_t eq = arg.find('=');
	if (eq == std::string_view::npos) {
		return {arg, std::nullopt};
	}
	return {arg.substr(0, eq), arg.substr(eq + 1)};
}

} // anonymous namespace

CliOptions parseCliOptions(std::span<const std::string_view> args)
{
	CliOptions options;
	bool optionsEnded = false;

	for (std::size_t i = 0; i < args.size(); i++) {
		const std::string_view arg = args[i];

		if (optionsEnded || arg.size() < 2 || arg[0] != '-') {
			if (options.text.has_value()) {
				throw CliUsageError(fmt::format("unrecognized argument: {}", arg));
			}
			options.text = std::string(arg);
			continue;
		}

		if (arg == "--") {
			optionsEnded = true;
			continue;
		}

		const auto [name, inlineValue] = splitOption(arg);

		const auto takeValue = [&, name = name, inlineValue = inlineValue]() -> std::string {
			if (inlineValue.has_value()) {
				return std::string(*inlineValue);
			}
			if (i + 1 >= args.size()) {
				throw CliUsageError(fmt::format("argument {}: expected one argument", name));
			}
			return std::string(args[++i]);
		};

		const auto rejectValue = [name = name, inlineValue = inlineValue]() {
			if (inlineValue.has_value()) {
				throw CliUsageError(fmt::format("argument {}: ignored explicit argument", name));
			}
		};

		if (name == "--from-file") {
			options.fromFile = takeValue();
		} else if (name == "--reply-to") {
			options.replyTo = takeValue();
		} else if (name == "--image") {
			options.image = takeValue();
		} else if (name == "--reset-auth") {
			rejectValue();
			options.resetAuth = true;
		} else if (name == "--reset-keys") {
			rejectValue();
			options.resetKeys = true;
		} else if (name == "--verbose" || name == "-v") {
			rejectValue();
			options.verbose = true;
		} else if (name == "--help" || name == "-h") {
			rejectValue();
			options.help = true;
		} else {
			throw CliUsageError(fmt::format("unrecognized argument: {}", arg));
		}
	}

	if (options.replyTo.has_value() && options.replyTo->empty()) {
		throw CliUsageError("argument --reply-to: post id is empty");
	}
	if (options.image.has_value() && options.image->empty()) {
		throw CliUsageError("argument --image: path is empty");
	}

	return options;
}

std::string usageText(std::string_view programName)
{
	return fmt::format("usage: {} [-h] [--from-file PATH] [--reply-to POST_ID] [--image PATH] [--reset-auth]\n"
			   "       {:{}} [--reset-keys] [--verbose] [text]\n"
			   "\n"
			   "Publish a post on X.\n"
			   "\n"
			   "positional arguments:\n"
			   "  text                Post text (inline)\n"
			   "\n"
			   "options:\n"
			   "  -h, --help          Show this help message and exit\n"
			   "  --from-file PATH    Read post text from a file\n"
			   "  --reply-to POST_ID  Post ID to reply to (for threading)\n"
			   "  --image PATH        Attach an image (jpg/png/gif/webp, max 5 MB)\n"
			   "  --reset-auth        Clear saved OAuth 2.0 tokens and re-authorize\n"
			   "  --reset-keys        Clear all saved credentials and re-prompt from scratch\n"
			   "  -v, --verbose       Log diagnostics to stderr\n",
			   programName, "", programName.size());
}

} // namespace XPost::Cli
