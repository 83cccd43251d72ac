#include <gtest/gtest.h>
#include "peerlink/core/config.hpp"
#include "support/test_support.hpp"
#include <fstream>
#include <filesystem>
#include <iterator>
#include <string>

using namespace peerlink::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = (dir_ / "test_config.txt").string();
    }

    peerlink::test::TempDir dir_;
    Config config;
    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
    EXPECT_TRUE(config.has("test.key"));
}

TEST_F(ConfigTest, GetNonExistent) {
    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(config.has("nonexistent.key"));
}

TEST_F(ConfigTest, GetTypedValues) {
    config.set("bool.true", "true");
    config.set("bool.yes", "YES");
    config.set("bool.false", "off");
    config.set("int.value", "42");
    config.set("big.value", "10737418240");
    config.set("string.value", "hello world");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false", true));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_uint64("big.value"), 10737418240ULL);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, MalformedValuesFallBackToDefault) {
    config.set("int.garbage", "12abc");
    config.set("uint.negative", "-5");
    config.set("bool.garbage", "maybe");

    EXPECT_EQ(config.get_int("int.garbage", 7), 7);
    EXPECT_EQ(config.get_uint64("uint.negative", 9), 9u);
    EXPECT_TRUE(config.get_bool("bool.garbage", true));
    EXPECT_FALSE(config.get_as<int>("int.garbage").has_value());
}

TEST_F(ConfigTest, DefaultValues) {
    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "key1=value1\n";
    file << "key2 = value2 \n";
    file << "not a setting\n";
    file << "bool.setting=true\n";
    file << "int.setting=100\n";
    file.close();

    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_TRUE(config.get_bool("bool.setting"));
    EXPECT_EQ(config.get_int("int.setting"), 100);
    EXPECT_FALSE(config.has("not a setting"));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(config.load_from_file((dir_ / "missing.conf").string()));
}

TEST_F(ConfigTest, SaveAndReload) {
    config.set("node.name", "alice");
    config.set("peer.bob", "10.0.0.2:12345");
    ASSERT_TRUE(config.save_to_file(test_file));

    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_file(test_file));
    EXPECT_EQ(reloaded.get_string("node.name"), "alice");
    EXPECT_EQ(reloaded.get_string("peer.bob"), "10.0.0.2:12345");
}

TEST_F(ConfigTest, SectionStripsPrefix) {
    config.set("peer.bob", "10.0.0.2");
    config.set("peer.carol", "10.0.0.3:4000");
    config.set("peers.other", "x");
    config.set("node.name", "alice");

    auto peers = config.get_section("peer.");
    ASSERT_EQ(peers.size(), 2u);
    EXPECT_EQ(peers["bob"], "10.0.0.2");
    EXPECT_EQ(peers["carol"], "10.0.0.3:4000");
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    config.set_defaults();
    EXPECT_EQ(config.get_int("listen.port"), 12345);
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 65536u);

    std::ofstream file(test_file);
    file << "listen.port=4000\n";
    file.close();

    ASSERT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_int("listen.port"), 4000);
    EXPECT_EQ(config.get_string("log.level"), "info");
}

TEST_F(ConfigTest, SectionHeadersPrefixKeys) {
    std::ofstream file(test_file);
    file << "log.level = debug\n";
    file << "[peer]\n";
    file << "bob = 10.0.0.2\n";
    file << "carol=10.0.0.3:4000\n";
    file << "[ transfer ]\n";
    file << "chunk_size = 4096\n";
    file.close();

    ASSERT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_string("log.level"), "debug");
    EXPECT_EQ(config.get_string("peer.bob"), "10.0.0.2");
    EXPECT_EQ(config.get_string("peer.carol"), "10.0.0.3:4000");
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 4096u);
    EXPECT_FALSE(config.has("bob"));
}

TEST_F(ConfigTest, SavedFileGroupsSections) {
    config.set("standalone", "1");
    config.set("peer.bob", "10.0.0.2");
    config.set("peer.carol", "10.0.0.3");
    config.set("node.name", "alice");
    ASSERT_TRUE(config.save_to_file(test_file));

    std::ifstream file(test_file);
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("[peer]\nbob = 10.0.0.2\ncarol = 10.0.0.3\n"), std::string::npos);
    EXPECT_LT(text.find("standalone = 1"), text.find("[node]"));

    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_file(test_file));
    EXPECT_EQ(reloaded.get_string("standalone"), "1");
    EXPECT_EQ(reloaded.get_string("peer.carol"), "10.0.0.3");
}
