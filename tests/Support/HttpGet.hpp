/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <string>

#include <QHostAddress>
#include <QTcpServer>

#include <curl/curl.h>

#include <XPost/CurlHelper/CurlHandle.hpp>
#include <XPost/CurlHelper/CurlWriteCallback.hpp>

namespace XPost::Testing {

struct HttpGetResult {
	CURLcode code = CURLE_OK;
	long status = 0;
	std::string body;
};

// Plays the browser following the redirect.
inline HttpGetResult httpGet(const std::string &url)
{
	CurlHelper::CurlHandle curlHandle;
	CURL *curl = curlHandle.getRaw();

	HttpGetResult result;
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
	curlHandle.setTimeouts(5L, 5L);

	result.code = curl_easy_perform(curl);
	result.status = curlHandle.responseCode();
	return result;
}

// Asks the kernel for a loopback port that is free right now.
inline std::uint16_t findFreeLoopbackPort()
{
	QTcpServer portFinder;
	if (!portFinder.listen(QHostAddress(QHostAddress::LocalHost), 0)) {
		return 0;
	}
	const std::uint16_t port = portFinder.serverPort();
	portFinder.close();
	return port;
}

} // namespace XPost::Testing
