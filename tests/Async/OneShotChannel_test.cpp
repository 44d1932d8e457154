/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include <XPost/Async/OneShotChannel.hpp>

using namespace XPost::Async;
using namespace std::chrono_literals;

TEST(OneShotChannelTest, ReceiveReturnsSentValue)
{
	OneShotChannel<std::string> channel;
	EXPECT_FALSE(channel.hasSent());

	EXPECT_TRUE(channel.send("hello"));
	EXPECT_TRUE(channel.hasSent());
	EXPECT_EQ(channel.receive(), "hello");
}

TEST(OneShotChannelTest, SecondSendIsRejected)
{
	OneShotChannel<int> channel;

	EXPECT_TRUE(channel.send(1));
	EXPECT_FALSE(channel.send(2));
	EXPECT_EQ(channel.receive(), 1);
}

TEST(OneShotChannelTest, SendAfterReceiveIsStillRejected)
{
	OneShotChannel<int> channel;
	ASSERT_TRUE(channel.send(7));
	ASSERT_EQ(channel.receive(), 7);

	EXPECT_FALSE(channel.send(8));
	EXPECT_EQ(channel.receiveFor(10ms), std::nullopt);
}

TEST(OneShotChannelTest, ReceiveBlocksUntilAnotherThreadSends)
{
	OneShotChannel<int> channel;

	std::thread producer([&channel] {
		std::this_thread::sleep_for(20ms);
		channel.send(99);
	});

	EXPECT_EQ(channel.receive(), 99);
	producer.join();
}

TEST(OneShotChannelTest, ReceiveForTimesOutWhenNothingIsSent)
{
	OneShotChannel<int> channel;

	const auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(channel.receiveFor(30ms), std::nullopt);
	EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST(OneShotChannelTest, ReceiveForReturnsValueSentInTime)
{
	OneShotChannel<std::string> channel;

	std::thread producer([&channel] { channel.send("late but in time"); });

	const std::optional<std::string> value = channel.receiveFor(5s);
	producer.join();

	ASSERT_TRUE(value.has_value());
	EXPECT_EQ(*value, "late but in time");
}
