/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <XPost/XApi/MediaFile.hpp>

#include <TemporaryDirectory.hpp>

using namespace XPost::XApi;
using XPost::Testing::TemporaryDirectory;

class MediaFileTest : public ::testing::Test {
protected:
	std::filesystem::path writeFile(const std::string &name, std::size_t size)
	{
		const auto path = dir.path / name;
		std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
		ofs << std::string(size, '\x42');
		return path;
	}

	TemporaryDirectory dir;
};

TEST_F(MediaFileTest, AcceptsEachSupportedType)
{
	EXPECT_EQ(inspectMediaFile(writeFile("a.jpg", 10)).contentType, "image/jpeg");
	EXPECT_EQ(inspectMediaFile(writeFile("a.jpeg", 10)).contentType, "image/jpeg");
	EXPECT_EQ(inspectMediaFile(writeFile("a.png", 10)).contentType, "image/png");
	EXPECT_EQ(inspectMediaFile(writeFile("a.gif", 10)).contentType, "image/gif");
	EXPECT_EQ(inspectMediaFile(writeFile("a.webp", 10)).contentType, "image/webp");
}

TEST_F(MediaFileTest, ExtensionIsCaseInsensitive)
{
	const MediaFile media = inspectMediaFile(writeFile("PHOTO.JPG", 3));

	EXPECT_EQ(media.contentType, "image/jpeg");
	EXPECT_EQ(media.size, 3u);
}

TEST_F(MediaFileTest, UnsupportedFormatIsRejected)
{
	const auto path = writeFile("scan.bmp", 10);

	try {
		(void)inspectMediaFile(path);
		FAIL() << "inspectMediaFile should have thrown";
	} catch (const MediaRejectedError &e) {
		EXPECT_STREQ(e.what(), "Unsupported image format '.bmp'. Supported: .gif, .jpeg, .jpg, .png, .webp");
	}
}

TEST_F(MediaFileTest, ExactLimitIsAccepted)
{
	EXPECT_EQ(inspectMediaFile(writeFile("big.png", kMaxMediaBytes)).size, kMaxMediaBytes);
}

TEST_F(MediaFileTest, OversizedFileIsRejected)
{
	const auto path = writeFile("huge.png", 6 * 1024 * 1024);

	try {
		(void)inspectMediaFile(path);
		FAIL() << "inspectMediaFile should have thrown";
	} catch (const MediaRejectedError &e) {
		EXPECT_STREQ(e.what(), "Image too large (6.0 MB). Maximum: 5 MB");
	}
}

TEST_F(MediaFileTest, MissingFileIsRejected)
{
	EXPECT_THROW((void)inspectMediaFile(dir.path / "absent.png"), MediaRejectedError);
	EXPECT_THROW((void)inspectMediaFile(dir.path), MediaRejectedError);
}
