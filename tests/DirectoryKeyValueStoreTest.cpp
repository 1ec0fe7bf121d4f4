#include "acedaw/store/DirectoryKeyValueStore.hpp"

#include "AcedawTestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace acedaw::store {
namespace {

using test_helpers::bytesOf;

class DirectoryKeyValueStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = test_helpers::uniqueTempDir("acedaw-dirstore");
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

TEST(KeyFileNameTest, EscapesDelimitersAndDecodesBack) {
    const std::string key = "audio:p1:clip/2:cumulative";
    const auto encoded = encodeKeyFileName(key);
    EXPECT_EQ(encoded, "audio%3Ap1%3Aclip%2F2%3Acumulative");
    EXPECT_EQ(decodeKeyFileName(encoded), key);
}

TEST(KeyFileNameTest, DotsAreEscapedSoKeysNeverNameSpecialEntries) {
    EXPECT_EQ(encodeKeyFileName(".."), "%2E%2E");
    EXPECT_EQ(decodeKeyFileName("%2E%2E"), "..");
}

TEST(KeyFileNameTest, RejectsNamesThatAreNotEncodings) {
    EXPECT_FALSE(decodeKeyFileName("").has_value());
    EXPECT_FALSE(decodeKeyFileName("project%3Ap1%tmp").has_value());
    EXPECT_FALSE(decodeKeyFileName("abc%4").has_value());
    EXPECT_FALSE(decodeKeyFileName("a%61").has_value());  // plain char escaped
    EXPECT_FALSE(decodeKeyFileName("notes.txt").has_value());
}

TEST_F(DirectoryKeyValueStoreTest, SetGetRemoveAndList) {
    auto store = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(store.has_value()) << store.error();

    ASSERT_TRUE(store->set("project:a", bytesOf("{\"id\":\"a\"}")).has_value());
    ASSERT_TRUE(store->set("audio:a:c1:cumulative", bytesOf("RIFF")).has_value());

    auto value = store->get("project:a");
    ASSERT_TRUE(value.has_value()) << value.error();
    ASSERT_TRUE(value->has_value());
    EXPECT_EQ(**value, bytesOf("{\"id\":\"a\"}"));

    auto keys = store->listKeys();
    ASSERT_TRUE(keys.has_value()) << keys.error();
    std::sort(keys->begin(), keys->end());
    EXPECT_EQ(*keys, (std::vector<std::string>{"audio:a:c1:cumulative", "project:a"}));

    ASSERT_TRUE(store->remove("project:a").has_value());
    auto removed = store->get("project:a");
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed->has_value());
}

TEST_F(DirectoryKeyValueStoreTest, OverwriteReplacesWholeValue) {
    auto store = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(store.has_value()) << store.error();

    ASSERT_TRUE(store->set("k", bytesOf("a much longer first value")).has_value());
    ASSERT_TRUE(store->set("k", bytesOf("short")).has_value());

    auto value = store->get("k");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->has_value());
    EXPECT_EQ(**value, bytesOf("short"));
}

TEST_F(DirectoryKeyValueStoreTest, MissingKeysAreAbsentAndRemovalIsIdempotent) {
    auto store = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(store.has_value()) << store.error();

    auto missing = store->get("project:none");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());

    EXPECT_TRUE(store->remove("project:none").has_value());
    EXPECT_TRUE(store->remove("project:none").has_value());
    EXPECT_FALSE(store->set("", bytesOf("x")).has_value());
}

TEST_F(DirectoryKeyValueStoreTest, ListIgnoresLeftoverTempAndForeignFiles) {
    auto store = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(store.has_value()) << store.error();
    ASSERT_TRUE(store->set("project:a", bytesOf("{}")).has_value());

    {
        std::ofstream(root_ / "project%3Ab%tmp") << "partial";
        std::ofstream(root_ / "README.md") << "not a key";
    }

    auto keys = store->listKeys();
    ASSERT_TRUE(keys.has_value()) << keys.error();
    EXPECT_EQ(*keys, std::vector<std::string>{"project:a"});
}

TEST_F(DirectoryKeyValueStoreTest, ValuesPersistAcrossReopen) {
    {
        auto store = DirectoryKeyValueStore::open(root_);
        ASSERT_TRUE(store.has_value()) << store.error();
        ASSERT_TRUE(store->set("audio:p:c:isolated", std::vector<uint8_t>{0x00, 0xFF, 0x10}).has_value());
    }

    auto reopened = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(reopened.has_value()) << reopened.error();
    auto value = reopened->get("audio:p:c:isolated");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->has_value());
    EXPECT_EQ(**value, (std::vector<uint8_t>{0x00, 0xFF, 0x10}));
}

#ifndef _WIN32
TEST_F(DirectoryKeyValueStoreTest, UnreadableEntryIsAnErrorNotAbsent) {
    auto store = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(store.has_value()) << store.error();

    // A link to itself cannot be resolved, so the key exists but cannot be inspected.
    const auto fileName = encodeKeyFileName("project:loop");
    std::error_code ec;
    std::filesystem::create_symlink(fileName, root_ / fileName, ec);
    ASSERT_FALSE(ec) << ec.message();

    auto value = store->get("project:loop");
    EXPECT_FALSE(value.has_value());
}
#endif

TEST_F(DirectoryKeyValueStoreTest, ListingVanishedDirectoryIsAnError) {
    auto store = DirectoryKeyValueStore::open(root_);
    ASSERT_TRUE(store.has_value()) << store.error();
    ASSERT_TRUE(store->set("project:a", bytesOf("{}")).has_value());

    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    ASSERT_FALSE(ec);

    EXPECT_FALSE(store->listKeys().has_value());

    auto missing = store->get("project:a");
    ASSERT_TRUE(missing.has_value()) << missing.error();
    EXPECT_FALSE(missing->has_value());
}

TEST(DirectoryKeyValueStoreOpenTest, RejectsEmptyPath) {
    EXPECT_FALSE(DirectoryKeyValueStore::open({}).has_value());
}

}  // namespace
}  // namespace acedaw::store
