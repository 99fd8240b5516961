#include <gtest/gtest.h>
#include "common/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

using rc_mcp::ServerConfig;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_env();
        dir_ = std::filesystem::temp_directory_path() /
               ("rcmcp_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        clear_env();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static void clear_env() {
        ::unsetenv("RCMCP_HOST");
        ::unsetenv("RCMCP_PORT");
        ::unsetenv("RCMCP_LOG_LEVEL");
    }

    std::string write_file(const std::string &name, const std::string &content) const {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, Defaults) {
    ServerConfig cfg;
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 13338);
    EXPECT_EQ(cfg.keepalive_interval.count(), 30000);
    EXPECT_EQ(cfg.worker_threads, 8u);
    EXPECT_EQ(cfg.max_streams, 8u);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.message_url(), "http://127.0.0.1:13338/message");
}

TEST_F(ConfigTest, FromJsonOverridesKnownKeys) {
    auto cfg = ServerConfig::from_json({
        {"host", "0.0.0.0"},
        {"port", 9000},
        {"keepalive_interval_ms", 1500},
        {"shutdown_grace_ms", 250},
        {"worker_threads", 2},
        {"max_streams", 3},
        {"log_level", "debug"}
    });
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.keepalive_interval.count(), 1500);
    EXPECT_EQ(cfg.shutdown_grace.count(), 250);
    EXPECT_EQ(cfg.worker_threads, 2u);
    EXPECT_EQ(cfg.max_streams, 3u);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(ConfigTest, FromJsonIgnoresBadValues) {
    auto cfg = ServerConfig::from_json({{"port", 70000}, {"worker_threads", 0}, {"host", 5}});
    EXPECT_EQ(cfg.port, 13338);
    EXPECT_EQ(cfg.worker_threads, 8u);
    EXPECT_EQ(cfg.host, "127.0.0.1");
}

TEST_F(ConfigTest, ToJsonRoundTrips) {
    ServerConfig cfg;
    cfg.port = 4242;
    cfg.log_level = "warn";
    auto back = ServerConfig::from_json(cfg.to_json());
    EXPECT_EQ(back.port, 4242);
    EXPECT_EQ(back.log_level, "warn");
}

TEST_F(ConfigTest, LoadMissingFileUsesDefaults) {
    auto cfg = ServerConfig::load((dir_ / "absent.json").string());
    EXPECT_EQ(cfg.port, 13338);
}

TEST_F(ConfigTest, LoadReadsFile) {
    auto path = write_file("good.json", R"({"port": 8123, "host": "localhost"})");
    auto cfg = ServerConfig::load(path);
    EXPECT_EQ(cfg.port, 8123);
    EXPECT_EQ(cfg.message_url(), "http://localhost:8123/message");
}

TEST_F(ConfigTest, LoadMalformedFileUsesDefaults) {
    auto path = write_file("bad.json", "{ port: ");
    auto cfg = ServerConfig::load(path);
    EXPECT_EQ(cfg.port, 13338);
    EXPECT_EQ(cfg.host, "127.0.0.1");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = write_file("env.json", R"({"port": 8123})");
    ::setenv("RCMCP_PORT", "9001", 1);
    ::setenv("RCMCP_HOST", "10.0.0.1", 1);
    ::setenv("RCMCP_LOG_LEVEL", "error", 1);

    auto cfg = ServerConfig::load(path);
    EXPECT_EQ(cfg.port, 9001);
    EXPECT_EQ(cfg.host, "10.0.0.1");
    EXPECT_EQ(cfg.log_level, "error");
}

TEST_F(ConfigTest, InvalidEnvironmentPortIsIgnored) {
    ::setenv("RCMCP_PORT", "not-a-port", 1);
    auto cfg = ServerConfig::load("");
    EXPECT_EQ(cfg.port, 13338);

    ::setenv("RCMCP_PORT", "65536", 1);
    cfg = ServerConfig::load("");
    EXPECT_EQ(cfg.port, 13338);
}

TEST_F(ConfigTest, MessageUrlAdvertisesLoopbackForWildcardHost) {
    ServerConfig cfg;
    cfg.port = 4000;
    cfg.host = "0.0.0.0";
    EXPECT_EQ(cfg.message_url(), "http://127.0.0.1:4000/message");
    cfg.host = "::";
    EXPECT_EQ(cfg.message_url(), "http://[::1]:4000/message");
    cfg.host = "::1";
    EXPECT_EQ(cfg.message_url(), "http://[::1]:4000/message");
    cfg.host = "192.168.1.5";
    EXPECT_EQ(cfg.message_url(), "http://192.168.1.5:4000/message");
}

} // namespace
