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

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <XPost/Async/OneShotChannel.hpp>
#include <XPost/Logger/ILogger.hpp>

#include "CallbackOutcome.hpp"

class QByteArray;
class QEventLoop;
class QTcpServer;
class QTcpSocket;

namespace XPost::OAuth2 {

/**
 * One-shot loopback HTTP server that receives the authorization redirect.
 *
 * The server runs on its own thread with its own Qt event loop, so the
 * thread that calls start() only blocks on the two channels. A
 * QCoreApplication must exist before start() is called.
 *
 * Requests for other paths are answered with 404 and do not consume the
 * attempt. The first request for the callback path is classified, answered
 * with an HTML page, and ends the listener.
 */
class CallbackListener {
public:
	CallbackListener(std::string host, std::uint16_t port, std::string callbackPath, std::string expectedState,
			 std::shared_ptr<const Logger::ILogger> logger);

	~CallbackListener() noexcept;

	CallbackListener(const CallbackListener &) = delete;
	CallbackListener &operator=(const CallbackListener &) = delete;
	CallbackListener(CallbackListener &&) = delete;
	CallbackListener &operator=(CallbackListener &&) = delete;

	// Returns once the socket is bound. Throws ListenError if it cannot be.
	void start();

	[[nodiscard]]
	CallbackOutcome waitForOutcome();

	[[nodiscard]]
	std::optional<CallbackOutcome> waitForOutcomeFor(std::chrono::milliseconds timeout);

	// Quits the event loop and joins the thread. Safe to call more than once.
	void stop() noexcept;

	// The bound port; differs from the requested one only when 0 was requested.
	[[nodiscard]]
	std::uint16_t port() const noexcept
	{
		return boundPort_;
	}

private:
	struct ListenResult {
		bool listening = false;
		std::uint16_t port = 0;
		std::string error;
	};

	void run();
	void handleRequestLine(QTcpSocket *socket, const QByteArray &requestLine, QTcpServer &server,
			       QEventLoop &loop);

	const std::string host_;
	const std::uint16_t requestedPort_;
	const std::string callbackPath_;
	const std::string expectedState_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	std::uint16_t boundPort_ = 0;
	// Touched only on the listener thread.
	bool callbackAnswered_ = false;
	std::thread thread_;

	Async::OneShotChannel<ListenResult> ready_;
	Async::OneShotChannel<CallbackOutcome> outcome_;

	std::mutex loopMutex_;
	QEventLoop *loop_ = nullptr;
};

} // namespace XPost::OAuth2
