#include <gtest/gtest.h>
#include "peerdrop/core/config.hpp"
#include "peerdrop/network/tcp_peer_connection.hpp"
#include "peerdrop/session/peer_session.hpp"
#include "peerdrop/signaling/http_signaling_client.hpp"
#include "peerdrop/signaling/signaling_relay.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

using namespace peerdrop::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_config.txt";
    }
    
    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();
    
    config.set("test.key", "test_value");
    
    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();
    
    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();
    
    config.set("bool.true", "true");
    config.set("bool.yes", "YES");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int.garbage", "forty-two");
    config.set("string.value", "hello world");
    
    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_int("int.garbage", 7), 7);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
    ASSERT_TRUE(config.get_as<double>("int.value").has_value());
    EXPECT_DOUBLE_EQ(*config.get_as<double>("int.value"), 42.0);
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();
    
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
    file << "signaling.url=http://relay.local:9000/peerdrop\n";
    file << "int.setting=100\n";
    file.close();
    
    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_EQ(config.get_string("signaling.url"), "http://relay.local:9000/peerdrop");
    EXPECT_EQ(config.get_int("int.setting"), 100);
    EXPECT_FALSE(config.get("not a setting").has_value());
}

TEST_F(ConfigTest, MalformedLinesAreReported) {
    std::ofstream file(test_file);
    file << "relay.port=9000\n";
    file << "just words\n";
    file << "= orphan value\n";
    file.close();
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_int("relay.port"), 9000);
    ASSERT_EQ(config.warnings().size(), 2u);
    EXPECT_EQ(config.warnings()[0].rfind(test_file + ":2:", 0), 0u);
    EXPECT_EQ(config.warnings()[1].rfind(test_file + ":3:", 0), 0u);
}

TEST_F(ConfigTest, EnvironmentOverridesKnownKeys) {
    EXPECT_EQ(Config::environment_name("relay.port"), "PEERDROP_RELAY_PORT");
    EXPECT_EQ(Config::environment_name("transfer.download_dir"), "PEERDROP_TRANSFER_DOWNLOAD_DIR");
    
    auto& config = Config::instance();
    config.set_defaults();
    
    ::setenv("PEERDROP_TEST_RELAY_PORT", "9100", 1);
    ::setenv("PEERDROP_TEST_UNKNOWN_KEY", "ignored", 1);
    EXPECT_EQ(config.apply_environment("PEERDROP_TEST_"), 1u);
    ::unsetenv("PEERDROP_TEST_RELAY_PORT");
    ::unsetenv("PEERDROP_TEST_UNKNOWN_KEY");
    
    EXPECT_EQ(config.get_int("relay.port"), 9100);
    EXPECT_FALSE(config.get("unknown.key").has_value());
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");
    
    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));
    
    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, DefaultsCoverEveryComponent) {
    auto& config = Config::instance();
    config.set_defaults();
    
    EXPECT_EQ(config.get_int("relay.port"), 8080);
    EXPECT_EQ(config.get_int("relay.session_ttl_seconds"), 600);
    EXPECT_EQ(config.get_string("signaling.url"), "http://127.0.0.1:8080");
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 16384);
    EXPECT_TRUE(config.get_bool("transfer.require_end_marker"));
    EXPECT_FALSE(config.get_bool("transfer.strict_protocol"));
    EXPECT_EQ(config.get_int("receive.count"), 1);
    EXPECT_EQ(config.get_string("log.level"), "info");
}

TEST_F(ConfigTest, TypedOptionsFromDefaults) {
    auto& config = Config::instance();
    config.set_defaults();
    
    auto relay = peerdrop::signaling::RelayOptions::from_config(config);
    EXPECT_EQ(relay.port, 8080);
    EXPECT_EQ(relay.bind_address, "0.0.0.0");
    EXPECT_EQ(relay.store.session_ttl, std::chrono::seconds(600));
    EXPECT_EQ(relay.store.code_length, 6u);
    EXPECT_EQ(relay.sweep_interval, std::chrono::seconds(60));
    
    auto transfer = peerdrop::transfer::TransferOptions::from_config(config);
    EXPECT_EQ(transfer.chunk_size, 16384u);
    EXPECT_EQ(transfer.max_buffered_bytes, 1048576u);
    EXPECT_TRUE(transfer.require_end_marker);
    EXPECT_FALSE(transfer.strict_protocol);
    EXPECT_EQ(transfer.download_dir, ".");
    
    auto bootstrap = peerdrop::session::BootstrapOptions::from_config(config);
    EXPECT_EQ(bootstrap.poll_interval, std::chrono::milliseconds(1000));
    
    auto signaling = peerdrop::signaling::HttpSignalingOptions::from_config(config);
    EXPECT_EQ(signaling.url, "http://127.0.0.1:8080");
    EXPECT_EQ(signaling.timeout, std::chrono::milliseconds(5000));
    
    auto peer = peerdrop::network::TcpPeerOptions::from_config(config);
    EXPECT_EQ(peer.listen_port, 0);
    EXPECT_EQ(peer.connect_timeout, std::chrono::milliseconds(10000));
}

TEST_F(ConfigTest, ShortCodeLengthIsRaisedToMinimum) {
    auto& config = Config::instance();
    config.set_defaults();

    config.set("relay.code_length", "2");
    EXPECT_EQ(peerdrop::signaling::RelayOptions::from_config(config).store.code_length,
              peerdrop::signaling::MIN_SESSION_CODE_LENGTH);

    config.set("relay.code_length", "8");
    EXPECT_EQ(peerdrop::signaling::RelayOptions::from_config(config).store.code_length, 8u);
    config.set_defaults();
}

TEST_F(ConfigTest, TypedOptionsFollowOverrides) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("relay.port", "9090");
    config.set("relay.session_ttl_seconds", "30");
    config.set("transfer.chunk_size", "4096");
    config.set("transfer.strict_protocol", "true");
    config.set("bootstrap.poll_interval_ms", "250");
    
    EXPECT_EQ(peerdrop::signaling::RelayOptions::from_config(config).port, 9090);
    EXPECT_EQ(peerdrop::signaling::RelayOptions::from_config(config).store.session_ttl, std::chrono::seconds(30));
    EXPECT_EQ(peerdrop::transfer::TransferOptions::from_config(config).chunk_size, 4096u);
    EXPECT_TRUE(peerdrop::transfer::TransferOptions::from_config(config).strict_protocol);
    EXPECT_EQ(peerdrop::session::BootstrapOptions::from_config(config).poll_interval, std::chrono::milliseconds(250));
}
