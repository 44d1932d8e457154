/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

#include <XPost/Logger/NullLogger.hpp>
#include <XPost/Logger/PrintLogger.hpp>

using namespace XPost::Logger;

namespace {

class CerrCapture {
public:
	CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
	~CerrCapture() { std::cerr.rdbuf(previous_); }

	CerrCapture(const CerrCapture &) = delete;
	CerrCapture &operator=(const CerrCapture &) = delete;

	std::string str() const { return buffer_.str(); }

private:
	std::ostringstream buffer_;
	std::streambuf *previous_;
};

} // anonymous namespace

TEST(LogLevelTest, ParsesSettingsNames)
{
	EXPECT_EQ(parseLogLevel("debug"), ILogger::LogLevel::Debug);
	EXPECT_EQ(parseLogLevel("info"), ILogger::LogLevel::Info);
	EXPECT_EQ(parseLogLevel("warn"), ILogger::LogLevel::Warn);
	EXPECT_EQ(parseLogLevel("error"), ILogger::LogLevel::Error);
	EXPECT_EQ(parseLogLevel("verbose"), std::nullopt);
	EXPECT_EQ(parseLogLevel("WARN"), std::nullopt);
}

TEST(LogLevelTest, NamesAreUpperCase)
{
	EXPECT_EQ(toString(ILogger::LogLevel::Debug), "DEBUG");
	EXPECT_EQ(toString(ILogger::LogLevel::Error), "ERROR");
}

TEST(PrintLoggerTest, WritesNameAndFields)
{
	CerrCapture capture;
	PrintLogger logger;

	logger.info("TokenRefreshed", {{"status", "200"}, {"grantType", "refresh_token"}});

	const std::string line = capture.str();
	EXPECT_NE(line.find("level=INFO"), std::string::npos);
	EXPECT_NE(line.find("\tname=TokenRefreshed"), std::string::npos);
	EXPECT_NE(line.find("\tstatus=200"), std::string::npos);
	EXPECT_NE(line.find("\tgrantType=refresh_token"), std::string::npos);
	EXPECT_NE(line.find("PrintLogger_test.cpp:"), std::string::npos);
	EXPECT_EQ(line.back(), '\n');
}

TEST(PrintLoggerTest, DropsEventsBelowMinimumLevel)
{
	CerrCapture capture;
	PrintLogger logger(ILogger::LogLevel::Warn);

	logger.debug("Hidden");
	logger.info("AlsoHidden");
	logger.error("Shown");

	const std::string output = capture.str();
	EXPECT_EQ(output.find("Hidden"), std::string::npos);
	EXPECT_NE(output.find("name=Shown"), std::string::npos);
}

TEST(NullLoggerTest, InstanceIsSharedAndSilent)
{
	CerrCapture capture;

	auto logger = NullLogger::instance();
	EXPECT_EQ(logger, NullLogger::instance());

	logger->error("Nothing");
	EXPECT_TRUE(capture.str().empty());
}
