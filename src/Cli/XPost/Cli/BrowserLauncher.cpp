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

#include "BrowserLauncher.hpp"

#include <cerrno>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

namespace XPost::Cli {

namespace {

#ifdef __APPLE__
constexpr const char *kOpenCommand = "open";
#else
constexpr const char *kOpenCommand = "xdg-open";
#endif

} // anonymous namespace

bool openInBrowser(const std::string &url, const Logger::ILogger &logger) noexcept
{
	if (url.empty()) {
		logger.error("BrowserUrlIsEmpty");
		return false;
	}

	const pid_t pid = fork();
	if (pid == 0) {
		execlp(kOpenCommand, kOpenCommand, url.c_str(), static_cast<char *>(nullptr));
		_exit(127);
	}

	if (pid < 0) {
		logger.error("BrowserForkError", {{"error", std::strerror(errno)}});
		return false;
	}

	int status = 0;
	pid_t result;
	do {
		result = waitpid(pid, &status, 0);
	} while (result == -1 && errno == EINTR);

	if (result == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
		logger.warn("BrowserLaunchFailed", {{"command", kOpenCommand}});
		return false;
	}

	logger.debug("BrowserLaunched", {{"command", kOpenCommand}});
	return true;
}

} // namespace XPost::Cli
