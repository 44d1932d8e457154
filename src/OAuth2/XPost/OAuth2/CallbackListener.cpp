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

#include "CallbackListener.hpp"

#include <stdexcept>
#include <utility>

#include <QByteArray>
#include <QEventLoop>
#include <QHostAddress>
#include <QMetaObject>
#include <QRegularExpression>
#include <QString>
#include <QTcpServer>
#include <QTcpSocket>
#include <QUrl>
#include <QUrlQuery>

#include <fmt/format.h>

#include "OAuth2Errors.hpp"

namespace XPost::OAuth2 {

namespace {

QHostAddress resolveListenAddress(const std::string &host)
{
	if (host == "localhost") {
		return QHostAddress(QHostAddress::LocalHost);
	}
	return QHostAddress(QString::fromStdString(host));
}

std::optional<std::string> queryItem(const QUrlQuery &query, const char *name)
{
	const QString key = QString::fromLatin1(name);
	if (!query.hasQueryItem(key)) {
		return std::nullopt;
	}
	return query.queryItemValue(key, QUrl::FullyDecoded).toStdString();
}

void writeResponse(QTcpSocket *socket, const char *status, const QByteArray &body)
{
	const QByteArray response = QString("HTTP/1.1 %1\r\n"
					    "Content-Type: text/html; charset=utf-8\r\n"
					    "Content-Length: %2\r\n"
					    "Connection: close\r\n"
					    "\r\n")
					    .arg(QString::fromLatin1(status))
					    .arg(body.size())
					    .toUtf8() +
				    body;

	socket->write(response);
	socket->flush();
}

} // anonymous namespace

CallbackListener::CallbackListener(std::string host, std::uint16_t port, std::string callbackPath,
				   std::string expectedState, std::shared_ptr<const Logger::ILogger> logger)
	: host_(std::move(host)),
	  requestedPort_(port),
	  callbackPath_(std::move(callbackPath)),
	  expectedState_(std::move(expectedState)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(CallbackListener)"))
{
}

CallbackListener::~CallbackListener() noexcept
{
	stop();
}

void CallbackListener::start()
{
	if (thread_.joinable()) {
		throw std::logic_error("AlreadyStartedError(CallbackListener::start)");
	}

	thread_ = std::thread([this] { run(); });

	ListenResult result = ready_.receive();
	if (!result.listening) {
		thread_.join();
		logger_->error("CallbackListenerBindFailed",
			       {{"host", host_}, {"port", std::to_string(requestedPort_)}, {"error", result.error}});
		throw ListenError(fmt::format("ListenError(CallbackListener::start): {}:{}: {}", host_, requestedPort_,
					      result.error));
	}

	boundPort_ = result.port;
	logger_->info("CallbackListenerStarted", {{"host", host_}, {"port", std::to_string(boundPort_)}});
}

CallbackOutcome CallbackListener::waitForOutcome()
{
	return outcome_.receive();
}

std::optional<CallbackOutcome> CallbackListener::waitForOutcomeFor(std::chrono::milliseconds timeout)
{
	return outcome_.receiveFor(timeout);
}

void CallbackListener::stop() noexcept
{
	{
		std::scoped_lock lock(loopMutex_);
		if (loop_) {
			QEventLoop *loop = loop_;
			QMetaObject::invokeMethod(loop, [loop] { loop->quit(); }, Qt::QueuedConnection);
		}
	}

	if (thread_.joinable()) {
		thread_.join();
	}
}

void CallbackListener::run()
{
	QEventLoop loop;
	QTcpServer server;

	QObject::connect(&server, &QTcpServer::newConnection, &loop, [this, &server, &loop]() {
		while (QTcpSocket *socket = server.nextPendingConnection()) {
			QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
			QObject::connect(socket, &QTcpSocket::readyRead, &loop, [this, socket, &server, &loop]() {
				if (!socket->canReadLine()) {
					return;
				}
				QObject::disconnect(socket, &QTcpSocket::readyRead, nullptr, nullptr);
				handleRequestLine(socket, socket->readLine(), server, loop);
			});
		}
	});

	const QHostAddress address = resolveListenAddress(host_);
	if (address.isNull()) {
		ready_.send(ListenResult{.listening = false, .port = 0, .error = "InvalidHostError"});
		return;
	}

	if (!server.listen(address, requestedPort_)) {
		ready_.send(ListenResult{
			.listening = false, .port = 0, .error = server.errorString().toStdString()});
		return;
	}

	{
		std::scoped_lock lock(loopMutex_);
		loop_ = &loop;
	}

	ready_.send(ListenResult{.listening = true, .port = server.serverPort(), .error = {}});

	loop.exec();

	std::scoped_lock lock(loopMutex_);
	loop_ = nullptr;
}

void CallbackListener::handleRequestLine(QTcpSocket *socket, const QByteArray &requestLine, QTcpServer &server,
					 QEventLoop &loop)
{
	static const QRegularExpression re("^GET\\s+(\\S+)\\s+HTTP");
	const QRegularExpressionMatch match = re.match(QString::fromUtf8(requestLine));

	if (!match.hasMatch()) {
		logger_->warn("CallbackListenerMalformedRequest");
		writeResponse(socket, "400 Bad Request", QByteArrayLiteral("<h1>Bad Request</h1>"));
		socket->disconnectFromHost();
		return;
	}

	const QUrl url(QStringLiteral("http://localhost") + match.captured(1));

	if (url.path().toStdString() != callbackPath_ || callbackAnswered_) {
		logger_->debug("CallbackListenerNotFound", {{"path", url.path().toStdString()}});
		writeResponse(socket, "404 Not Found", QByteArrayLiteral("<h1>Not Found</h1>"));
		socket->disconnectFromHost();
		return;
	}

	const QUrlQuery query(url);
	CallbackParameters parameters{
		.code = queryItem(query, "code"),
		.state = queryItem(query, "state"),
		.error = queryItem(query, "error"),
	};

	CallbackOutcome outcome = classifyCallback(parameters, expectedState_);
	callbackAnswered_ = true;

	if (std::holds_alternative<AuthorizationCode>(outcome)) {
		logger_->info("CallbackListenerCodeReceived");
	} else if (const auto *error = std::get_if<AuthorizationError>(&outcome)) {
		logger_->warn("CallbackListenerProviderError", {{"reason", error->reason}});
	} else {
		logger_->warn("CallbackListenerStateMismatch");
	}

	writeResponse(socket, "200 OK", QByteArray::fromStdString(renderCallbackPage(outcome)));

	server.close();

	if (socket->state() == QAbstractSocket::UnconnectedState) {
		outcome_.send(std::move(outcome));
		loop.quit();
		return;
	}

	// Published once the page is flushed and the peer is gone.
	QObject::connect(
		socket, &QTcpSocket::disconnected, &loop,
		[this, &loop, outcome = std::move(outcome)]() mutable {
			outcome_.send(std::move(outcome));
			loop.quit();
		},
		Qt::QueuedConnection);

	socket->disconnectFromHost();
}

} // namespace XPost::OAuth2
