/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include <XPost/Cli/CliOptions.hpp>

using namespace XPost::Cli;

namespace {

CliOptions parse(std::vector<std::string_view> args)
{
	return parseCliOptions(args);
}

} // anonymous namespace

TEST(CliOptionsTest, NoArgumentsMeansStdin)
{
	const CliOptions options = parse({});

	EXPECT_FALSE(options.text.has_value());
	EXPECT_FALSE(options.fromFile.has_value());
	EXPECT_FALSE(options.replyTo.has_value());
	EXPECT_FALSE(options.image.has_value());
	EXPECT_FALSE(options.resetAuth);
	EXPECT_FALSE(options.resetKeys);
	EXPECT_FALSE(options.help);
}

TEST(CliOptionsTest, PositionalText)
{
	EXPECT_EQ(parse({"Hello world"}).text, "Hello world");
}

TEST(CliOptionsTest, ValuesInBothForms)
{
	const CliOptions options = parse({"--reply-to", "1234", "--from-file=post.txt"});

	EXPECT_EQ(options.replyTo, "1234");
	ASSERT_TRUE(options.fromFile.has_value());
	EXPECT_EQ(options.fromFile->string(), "post.txt");
}

TEST(CliOptionsTest, ImagePath)
{
	const CliOptions options = parse({"--image", "photo.jpg", "look at this"});

	ASSERT_TRUE(options.image.has_value());
	EXPECT_EQ(options.image->string(), "photo.jpg");
	EXPECT_EQ(options.text, "look at this");
	EXPECT_EQ(parse({"--image=a.png"}).image->string(), "a.png");
}

TEST(CliOptionsTest, EmptyImagePathIsUsageError)
{
	EXPECT_THROW((void)parse({"--image="}), CliUsageError);
	EXPECT_THROW((void)parse({"--image"}), CliUsageError);
}

TEST(CliOptionsTest, Flags)
{
	const CliOptions options = parse({"--reset-auth", "--reset-keys", "-v", "text"});

	EXPECT_TRUE(options.resetAuth);
	EXPECT_TRUE(options.resetKeys);
	EXPECT_TRUE(options.verbose);
	EXPECT_EQ(options.text, "text");
}

TEST(CliOptionsTest, HelpFlag)
{
	EXPECT_TRUE(parse({"-h"}).help);
	EXPECT_TRUE(parse({"--help"}).help);
}

TEST(CliOptionsTest, DoubleDashAllowsLeadingDash)
{
	EXPECT_EQ(parse({"--", "-1 is a number"}).text, "-1 is a number");
}

TEST(CliOptionsTest, LoneDashIsText)
{
	EXPECT_EQ(parse({"-"}).text, "-");
}

TEST(CliOptionsTest, UnknownOptionIsUsageError)
{
	EXPECT_THROW((void)parse({"--schedule", "tomorrow"}), CliUsageError);
}

TEST(CliOptionsTest, MissingValueIsUsageError)
{
	EXPECT_THROW((void)parse({"--reply-to"}), CliUsageError);
}

TEST(CliOptionsTest, EmptyReplyToIsUsageError)
{
	EXPECT_THROW((void)parse({"--reply-to="}), CliUsageError);
}

TEST(CliOptionsTest, SecondPositionalIsUsageError)
{
	EXPECT_THROW((void)parse({"one", "two"}), CliUsageError);
}

TEST(CliOptionsTest, FlagWithValueIsUsageError)
{
	EXPECT_THROW((void)parse({"--reset-auth=yes"}), CliUsageError);
}

TEST(CliOptionsTest, UsageNamesEveryOption)
{
	const std::string usage = usageText("x-post");

	EXPECT_EQ(usage.rfind("usage: x-post ", 0), 0u);
	for (const char *option : {"--from-file", "--reply-to", "--image", "--reset-auth", "--reset-keys", "--verbose"}) {
		EXPECT_NE(usage.find(option), std::string::npos) << option;
	}
}
