/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <QCoreApplication>

#include <curl/curl.h>

// The callback listener needs a QCoreApplication before it creates its event loop.
int main(int argc, char **argv)
{
	QCoreApplication app(argc, argv);
	curl_global_init(CURL_GLOBAL_DEFAULT);

	::testing::InitGoogleTest(&argc, argv);
	const int result = RUN_ALL_TESTS();

	curl_global_cleanup();
	return result;
}
