/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <QByteArray>
#include <QEventLoop>
#include <QHostAddress>
#include <QMetaObject>
#include <QTcpServer>
#include <QTcpSocket>

#include <XPost/Async/OneShotChannel.hpp>

namespace XPost::Testing {

/**
 * Loopback HTTP/1.1 server that answers with scripted responses, in order.
 * The last response is repeated once the script runs out. Every complete
 * request (headers and body) is recorded verbatim.
 */
class CannedHttpServer {
public:
	struct Response {
		int status = 200;
		std::string body;
	};

	explicit CannedHttpServer(std::vector<Response> responses) : responses_(std::move(responses))
	{
		if (responses_.empty()) {
			throw std::invalid_argument("ResponsesAreEmptyError(CannedHttpServer)");
		}
		thread_ = std::thread([this] { run(); });
		port_ = ready_.receive();
		if (port_ == 0) {
			thread_.join();
			throw std::runtime_error("ListenError(CannedHttpServer)");
		}
	}

	~CannedHttpServer()
	{
		{
			std::scoped_lock lock(mutex_);
			if (loop_) {
				QEventLoop *loop = loop_;
				QMetaObject::invokeMethod(loop, [loop] { loop->quit(); }, Qt::QueuedConnection);
			}
		}
		thread_.join();
	}

	CannedHttpServer(const CannedHttpServer &) = delete;
	CannedHttpServer &operator=(const CannedHttpServer &) = delete;

	std::string url(const std::string &path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

	std::vector<std::string> requests() const
	{
		std::scoped_lock lock(mutex_);
		return requests_;
	}

private:
	void run()
	{
		QEventLoop loop;
		QTcpServer server;

		QObject::connect(&server, &QTcpServer::newConnection, &loop, [this, &server, &loop]() {
			while (QTcpSocket *socket = server.nextPendingConnection()) {
				auto buffer = std::make_shared<QByteArray>();
				QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
				QObject::connect(socket, &QTcpSocket::readyRead, &loop,
						 [this, socket, buffer]() { onReadyRead(socket, *buffer); });
			}
		});

		if (!server.listen(QHostAddress(QHostAddress::LocalHost), 0)) {
			ready_.send(0);
			return;
		}

		{
			std::scoped_lock lock(mutex_);
			loop_ = &loop;
		}
		ready_.send(server.serverPort());

		loop.exec();

		std::scoped_lock lock(mutex_);
		loop_ = nullptr;
	}

	void onReadyRead(QTcpSocket *socket, QByteArray &buffer)
	{
		buffer += socket->readAll();

		const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
		if (headerEnd < 0) {
			return;
		}

		qsizetype contentLength = 0;
		for (const QByteArray &line : buffer.left(headerEnd).split('\n')) {
			const QByteArray trimmed = line.trimmed();
			if (trimmed.toLower().startsWith("content-length:")) {
				contentLength = trimmed.mid(15).trimmed().toLongLong();
			}
		}
		if (buffer.size() < headerEnd + 4 + contentLength) {
			return;
		}

		Response response;
		{
			std::scoped_lock lock(mutex_);
			requests_.push_back(buffer.toStdString());
			response = responses_[std::min(served_, responses_.size() - 1)];
			served_++;
		}
		buffer.clear();

		const QByteArray body = QByteArray::fromStdString(response.body);
		const QByteArray head = QByteArray("HTTP/1.1 ") + QByteArray::number(response.status) +
					" Canned\r\nContent-Type: application/json\r\nContent-Length: " +
					QByteArray::number(body.size()) + "\r\nConnection: close\r\n\r\n";
		socket->write(head + body);
		socket->flush();
		socket->disconnectFromHost();
	}

	const std::vector<Response> responses_;
	std::thread thread_;
	std::uint16_t port_ = 0;
	Async::OneShotChannel<std::uint16_t> ready_;

	mutable std::mutex mutex_;
	QEventLoop *loop_ = nullptr;
	std::vector<std::string> requests_;
	std::size_t served_ = 0;
};

} // namespace XPost::Testing
