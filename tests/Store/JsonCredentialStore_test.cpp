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
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include <XPost/Logger/NullLogger.hpp>
#include <XPost/Store/JsonCredentialStore.hpp>

#include <StoreDoubles.hpp>

using namespace XPost;
using namespace XPost::Store;
using XPost::Testing::TemporaryDirectory;

namespace {

std::string readFile(const std::filesystem::path &path)
{
	std::ifstream ifs(path);
	std::stringstream ss;
	ss << ifs.rdbuf();
	return ss.str();
}

void writeFile(const std::filesystem::path &path, const std::string &content)
{
	std::filesystem::create_directories(path.parent_path());
	std::ofstream ofs(path, std::ios::out | std::ios::trunc);
	ofs << content;
}

} // anonymous namespace

class JsonCredentialStoreTest : public ::testing::Test {
protected:
	TemporaryDirectory dir;
	std::filesystem::path path = dir.path / "x-post-cli" / "config.json";
	JsonCredentialStore store{path, Logger::NullLogger::instance()};
};

TEST_F(JsonCredentialStoreTest, MissingFileReadsAsEmpty)
{
	EXPECT_EQ(store.get(kClientIdKey), std::nullopt);
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(JsonCredentialStoreTest, SetCreatesDirectoryAndPrettyFile)
{
	store.set(kClientIdKey, "abc");

	ASSERT_TRUE(std::filesystem::exists(path));
	EXPECT_EQ(readFile(path), "{\n  \"client_id\": \"abc\"\n}\n");
	EXPECT_EQ(store.get(kClientIdKey), "abc");
	EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
}

TEST_F(JsonCredentialStoreTest, FileIsOwnerReadWriteOnly)
{
	store.set(kClientSecretKey, "secret");

	const auto perms = std::filesystem::status(path).permissions();
	EXPECT_EQ(perms & std::filesystem::perms::all,
		  std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
}

TEST_F(JsonCredentialStoreTest, SetKeepsOtherKeys)
{
	store.set(kClientIdKey, "id");
	store.set(kClientSecretKey, "secret");

	EXPECT_EQ(store.get(kClientIdKey), "id");
	EXPECT_EQ(store.get(kClientSecretKey), "secret");
}

TEST_F(JsonCredentialStoreTest, SetManyWritesEveryEntry)
{
	store.set(kClientIdKey, "id");
	store.setMany({{"access_token", "a1"}, {"refresh_token", "r1"}});

	const auto j = nlohmann::json::parse(readFile(path));
	EXPECT_EQ(j, (nlohmann::json{{"client_id", "id"}, {"access_token", "a1"}, {"refresh_token", "r1"}}));
}

TEST_F(JsonCredentialStoreTest, RemoveIgnoresMissingKeys)
{
	store.setMany({{"client_id", "id"}, {"access_token", "a1"}, {"refresh_token", "r1"}});

	store.remove({"access_token", "refresh_token", "not_there"});

	EXPECT_EQ(store.get(kAccessTokenKey), std::nullopt);
	EXPECT_EQ(store.get(kRefreshTokenKey), std::nullopt);
	EXPECT_EQ(store.get(kClientIdKey), "id");
}

TEST_F(JsonCredentialStoreTest, ExistingFileIsRead)
{
	writeFile(path, R"({"client_id": "from-disk", "other": 1})");

	EXPECT_EQ(store.get(kClientIdKey), "from-disk");
	EXPECT_EQ(store.get("other"), std::nullopt);
}

TEST_F(JsonCredentialStoreTest, MalformedFileIsAnError)
{
	writeFile(path, "{ not json");

	EXPECT_THROW((void)store.get(kClientIdKey), std::runtime_error);
	EXPECT_THROW(store.set(kClientIdKey, "x"), std::runtime_error);
	EXPECT_EQ(readFile(path), "{ not json");
}

TEST_F(JsonCredentialStoreTest, NonObjectFileIsAnError)
{
	writeFile(path, "[1, 2, 3]");

	EXPECT_THROW((void)store.get(kClientIdKey), std::runtime_error);
}

TEST_F(JsonCredentialStoreTest, SecondInstanceSeesWrites)
{
	store.set(kAccessTokenKey, "a1");

	JsonCredentialStore other(path, Logger::NullLogger::instance());
	EXPECT_EQ(other.get(kAccessTokenKey), "a1");
}

TEST(JsonCredentialStoreConstructionTest, EmptyPathIsRejected)
{
	EXPECT_THROW(JsonCredentialStore(std::filesystem::path{}, Logger::NullLogger::instance()),
		     std::invalid_argument);
}
