#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "server/config.hpp"
#include "util/logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using MiniKV::ConfigError;
using MiniKV::parse_args;

class ConfigFileTest : public ::testing::Test {
protected:
  std::filesystem::path path;

  void SetUp() override {
    path = std::filesystem::temp_directory_path() /
           ("minikv_test_" + std::to_string(::getpid()) + ".conf");
  }

  void TearDown() override { std::filesystem::remove(path); }

  void write(const std::string &contents) {
    std::ofstream out(path);
    out << contents;
  }
};

TEST(ConfigArgs, Defaults) {
  MiniKV::ServerConfig cfg = parse_args(std::vector<std::string>{});
  EXPECT_EQ(cfg.host, "127.0.0.1");
  EXPECT_EQ(cfg.port, 6380);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.expiry_interval_ms, 100);
  EXPECT_EQ(cfg.client_timeout, 0);
  EXPECT_FALSE(cfg.show_help);
}

TEST(ConfigArgs, FlagsInBothSpellings) {
  MiniKV::ServerConfig cfg =
      parse_args({"--host", "0.0.0.0", "--port=7001", "--loglevel", "debug",
                  "--expiry-interval=0", "--maxclients", "5", "--timeout",
                  "30"});
  EXPECT_EQ(cfg.host, "0.0.0.0");
  EXPECT_EQ(cfg.port, 7001);
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.expiry_interval_ms, 0);
  EXPECT_EQ(cfg.max_clients, 5);
  EXPECT_EQ(cfg.client_timeout, 30);
}

TEST(ConfigArgs, BarePortNumber) {
  EXPECT_EQ(parse_args({"6390"}).port, 6390);
  EXPECT_THROW(parse_args({"--port", "1", "6390"}), ConfigError);
}

TEST(ConfigArgs, InvalidValuesThrow) {
  EXPECT_THROW(parse_args({"--port", "http"}), ConfigError);
  EXPECT_THROW(parse_args({"--port", "70000"}), ConfigError);
  EXPECT_THROW(parse_args({"--port"}), ConfigError);
  EXPECT_THROW(parse_args({"--loglevel", "chatty"}), ConfigError);
  EXPECT_THROW(parse_args({"--maxclients", "0"}), ConfigError);
  EXPECT_THROW(parse_args({"--colour", "blue"}), ConfigError);
}

TEST(ConfigArgs, Help) {
  EXPECT_TRUE(parse_args({"--help"}).show_help);
  EXPECT_NE(MiniKV::usage("minikv-server").find("--port"), std::string::npos);
}

TEST(ConfigArgs, LogLevels) {
  EXPECT_EQ(MiniKV::parse_log_level("error"), MiniKV::LogLevel::Error);
  EXPECT_EQ(MiniKV::parse_log_level("warning"), MiniKV::LogLevel::Warn);
  EXPECT_EQ(MiniKV::parse_log_level("debug"), MiniKV::LogLevel::Debug);
  EXPECT_THROW(MiniKV::parse_log_level("loud"), ConfigError);
}

TEST_F(ConfigFileTest, FileSettings) {
  write("# minikv config\n"
        "bind 0.0.0.0\n"
        "port 7100   # trailing comment\n"
        "\n"
        "loglevel warn\n"
        "hz-interval-ms 250\n"
        "timeout 60\n");

  MiniKV::ServerConfig cfg;
  MiniKV::load_config_file(path.string(), cfg);
  EXPECT_EQ(cfg.host, "0.0.0.0");
  EXPECT_EQ(cfg.port, 7100);
  EXPECT_EQ(cfg.log_level, "warn");
  EXPECT_EQ(cfg.expiry_interval_ms, 250);
  EXPECT_EQ(cfg.client_timeout, 60);
}

TEST_F(ConfigFileTest, FlagsOverrideFile) {
  write("port 7100\nloglevel warn\n");
  MiniKV::ServerConfig cfg =
      parse_args({"--port", "7200", "--config", path.string()});
  EXPECT_EQ(cfg.port, 7200);
  EXPECT_EQ(cfg.log_level, "warn");
}

TEST_F(ConfigFileTest, BadFilesThrow) {
  write("port\n");
  MiniKV::ServerConfig cfg;
  EXPECT_THROW(MiniKV::load_config_file(path.string(), cfg), ConfigError);

  write("appendonly yes\n");
  EXPECT_THROW(MiniKV::load_config_file(path.string(), cfg), ConfigError);

  EXPECT_THROW(MiniKV::load_config_file("/nonexistent/minikv.conf", cfg),
               ConfigError);
}
