#include <gtest/gtest.h>
#include "peerlink/engine/engine_settings.hpp"
#include "peerlink/engine/peer_directory.hpp"

using namespace peerlink::engine;
using peerlink::core::Config;
using peerlink::core::ErrorCode;

class EngineSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.set_defaults();
    }

    Config config;
};

TEST_F(EngineSettingsTest, DefaultsAreValid) {
    auto settings = EngineSettings::from_config(config);

    EXPECT_TRUE(settings.validate());
    EXPECT_EQ(settings.listen_port, 12345);
    EXPECT_EQ(settings.protocol.chunk_size, 65536u);
    EXPECT_EQ(settings.connection.listen_port, settings.listen_port);
    EXPECT_EQ(settings.connection.local_name, settings.node_name);
}

TEST_F(EngineSettingsTest, ReadsConfiguredValues) {
    config.set("node.name", "alice");
    config.set("listen.port", "4000");
    config.set("transfer.chunk_size", "4096");
    config.set("transfer.ack_timeout_ms", "750");
    config.set("transfer.checksum", "crc32");
    config.set("reconnect.window_ms", "60000");
    config.set("log.level", "debug");
    config.set("storage.data_directory", "/tmp/peerlink-data");

    auto settings = EngineSettings::from_config(config);

    EXPECT_EQ(settings.node_name, "alice");
    EXPECT_EQ(settings.listen_port, 4000);
    EXPECT_EQ(settings.protocol.chunk_size, 4096u);
    EXPECT_EQ(settings.protocol.ack_timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(settings.protocol.checksum, peerlink::network::ChecksumAlgorithm::CRC32);
    EXPECT_EQ(settings.connection.reconnect.window, std::chrono::milliseconds(60000));
    EXPECT_EQ(settings.log_level, peerlink::core::LogLevel::Debug);
    EXPECT_EQ(settings.database_path(), std::filesystem::path("/tmp/peerlink-data") / "peerlink.db");
    EXPECT_EQ(settings.connection.local_name, "alice");
}

TEST_F(EngineSettingsTest, MalformedValuesKeepDefaults) {
    config.set("listen.port", "70000");
    config.set("transfer.chunk_size", "big");
    config.set("transfer.checksum", "md5");

    auto settings = EngineSettings::from_config(config);
    EngineSettings defaults;

    EXPECT_EQ(settings.listen_port, defaults.listen_port);
    EXPECT_EQ(settings.protocol.chunk_size, defaults.protocol.chunk_size);
    EXPECT_EQ(settings.protocol.checksum, defaults.protocol.checksum);
}

TEST_F(EngineSettingsTest, ValidateRejectsBadValues) {
    auto settings = EngineSettings::from_config(config);

    auto bad = settings;
    bad.node_name.clear();
    EXPECT_EQ(bad.validate().error, ErrorCode::INVALID_ARGUMENT);

    bad = settings;
    bad.protocol.chunk_size = 0;
    EXPECT_FALSE(bad.validate());

    bad = settings;
    bad.protocol.window_bytes = bad.protocol.chunk_size - 1;
    EXPECT_FALSE(bad.validate());

    bad = settings;
    bad.connection.idle_timeout = bad.connection.heartbeat_interval;
    EXPECT_FALSE(bad.validate());

    bad = settings;
    bad.connection.reconnect.max_delay = bad.connection.reconnect.initial_delay / 2;
    EXPECT_FALSE(bad.validate());

    bad = settings;
    bad.io_threads = 0;
    EXPECT_FALSE(bad.validate());
}

TEST(PeerDirectoryTest, ParseAddressForms) {
    auto plain = PeerDirectory::parse_address("bob", "10.0.0.2:4000");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->name, "bob");
    EXPECT_EQ(plain->host, "10.0.0.2");
    EXPECT_EQ(plain->port, 4000);

    auto bare = PeerDirectory::parse_address("bob", " bob.local ");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->host, "bob.local");
    EXPECT_EQ(bare->port, peerlink::network::DEFAULT_PORT);

    auto v6 = PeerDirectory::parse_address("carol", "[::1]:5000");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->host, "::1");
    EXPECT_EQ(v6->port, 5000);

    auto bare_v6 = PeerDirectory::parse_address("carol", "fe80::1");
    ASSERT_TRUE(bare_v6.has_value());
    EXPECT_EQ(bare_v6->host, "fe80::1");
}

TEST(PeerDirectoryTest, ParseAddressRejectsInvalid) {
    EXPECT_FALSE(PeerDirectory::parse_address("bob", "").has_value());
    EXPECT_FALSE(PeerDirectory::parse_address("", "10.0.0.2").has_value());
    EXPECT_FALSE(PeerDirectory::parse_address("bob", "10.0.0.2:0").has_value());
    EXPECT_FALSE(PeerDirectory::parse_address("bob", "10.0.0.2:65536").has_value());
    EXPECT_FALSE(PeerDirectory::parse_address("bob", "10.0.0.2:12ab").has_value());
    EXPECT_FALSE(PeerDirectory::parse_address("bob", ":4000").has_value());
    EXPECT_FALSE(PeerDirectory::parse_address("bob", "[::1").has_value());
}

TEST(PeerDirectoryTest, LoadFromConfig) {
    Config config;
    config.set("peer.bob", "10.0.0.2:4000");
    config.set("peer.carol", "10.0.0.3");
    config.set("peer.broken", "10.0.0.4:0");
    config.set("node.name", "alice");

    PeerDirectory directory;
    EXPECT_EQ(directory.load(config), 2u);
    EXPECT_TRUE(directory.contains("bob"));
    EXPECT_TRUE(directory.contains("carol"));
    EXPECT_FALSE(directory.contains("broken"));
    EXPECT_EQ(directory.list().size(), 2u);

    directory.add({"bob", "10.0.0.9", 4001});
    auto bob = directory.find("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->host, "10.0.0.9");
    EXPECT_FALSE(directory.find("dave").has_value());
}
