/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <XPost/XApi/XTypes.hpp>

using namespace XPost::XApi;

TEST(XTypesTest, DraftWithoutReplyHasOnlyText)
{
	const nlohmann::json j = XPostDraft{.text = "hello", .in_reply_to_post_id = std::nullopt};

	EXPECT_EQ(j, (nlohmann::json{{"text", "hello"}}));
}

TEST(XTypesTest, DraftWithReplyNestsTheParentId)
{
	const nlohmann::json j = XPostDraft{.text = "second", .in_reply_to_post_id = "1234567890"};

	EXPECT_EQ(j["text"], "second");
	EXPECT_EQ(j["reply"]["in_reply_to_tweet_id"], "1234567890");
}

TEST(XTypesTest, UserParsesWithoutName)
{
	const auto user = nlohmann::json::parse(R"({"id": "1", "username": "bob"})").get<XUser>();

	EXPECT_EQ(user.id, "1");
	EXPECT_EQ(user.username, "bob");
	EXPECT_EQ(user.name, "");
}

TEST(XTypesTest, UserRequiresUsername)
{
	EXPECT_THROW((void)nlohmann::json::parse(R"({"id": "1"})").get<XUser>(), nlohmann::json::exception);
}

TEST(XTypesTest, CreatedPostParses)
{
	const auto post =
		nlohmann::json::parse(R"({"id": "1445880548472328192", "text": "Hello", "edit_history_tweet_ids": []})")
			.get<XCreatedPost>();

	EXPECT_EQ(post.id, "1445880548472328192");
	EXPECT_EQ(post.text, "Hello");
}

TEST(XTypesTest, DraftWithMediaListsTheIds)
{
	const nlohmann::json j =
		XPostDraft{.text = "look", .in_reply_to_post_id = std::nullopt, .media_ids = {"710511363345354753"}};

	EXPECT_EQ(j["media"], (nlohmann::json{{"media_ids", {"710511363345354753"}}}));
	EXPECT_FALSE(j.contains("reply"));
}

TEST(XTypesTest, UploadedMediaPrefersStringId)
{
	const auto media =
		nlohmann::json::parse(R"({"media_id": 710511363345354753, "media_id_string": "710511363345354753"})")
			.get<XUploadedMedia>();

	EXPECT_EQ(media.media_id, "710511363345354753");
}

TEST(XTypesTest, UploadedMediaAcceptsNumericIdAlone)
{
	const auto media = nlohmann::json::parse(R"({"media_id": 710511363345354753})").get<XUploadedMedia>();

	EXPECT_EQ(media.media_id, "710511363345354753");
}
