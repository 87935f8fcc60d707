#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config_parser.hpp"

#include <string>

namespace aurix::config {
namespace {

class ConfigParserTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Write(const std::string& json) {
        const std::string path = tmp.Join("aurix-flash.conf");
        testutil::WriteFile(path, json);
        return path;
    }
};

TEST_F(ConfigParserTests, LoadsAllKeys) {
    const auto path = Write(R"({
        "UdasPort": 3,
        "HaltMemtool": true,
        "TempRoot": "/var/tmp",
        "MemtoolPath": "/opt/infineon/IMTMemtool",
        "LogLevel": "Debug"
    })");

    FlashToolConfigFromFile cfg;
    auto res = cfg.LoadFile(path);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(cfg.udas_port.has_value());
    EXPECT_EQ(*cfg.udas_port, 3u);
    ASSERT_TRUE(cfg.halt_memtool.has_value());
    EXPECT_TRUE(*cfg.halt_memtool);
    EXPECT_EQ(cfg.temp_root, "/var/tmp");
    EXPECT_EQ(cfg.memtool_path, "/opt/infineon/IMTMemtool");
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, LogLevel::Debug);
}

TEST_F(ConfigParserTests, EmptyObjectLeavesDefaults) {
    FlashToolConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(Write("{}")).is_ok());
    EXPECT_FALSE(cfg.udas_port.has_value());
    EXPECT_FALSE(cfg.halt_memtool.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_TRUE(cfg.temp_root.empty());
    EXPECT_TRUE(cfg.memtool_path.empty());
}

TEST_F(ConfigParserTests, MissingFileFails) {
    FlashToolConfigFromFile cfg;
    auto res = cfg.LoadFile(tmp.Join("missing.conf"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ConfigInvalid);
}

TEST_F(ConfigParserTests, InvalidJsonFails) {
    FlashToolConfigFromFile cfg;
    auto res = cfg.LoadFile(Write("{ UdasPort: "));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("invalid JSON"), std::string::npos) << res.msg;
}

TEST_F(ConfigParserTests, RootMustBeObject) {
    FlashToolConfigFromFile cfg;
    EXPECT_FALSE(cfg.LoadFile(Write("[1, 2]")).is_ok());
}

TEST_F(ConfigParserTests, NegativePortRejected) {
    FlashToolConfigFromFile cfg;
    auto res = cfg.LoadFile(Write(R"({"UdasPort": -1})"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("UdasPort"), std::string::npos) << res.msg;
    EXPECT_FALSE(cfg.udas_port.has_value());
}

TEST_F(ConfigParserTests, WrongTypesRejected) {
    FlashToolConfigFromFile cfg;
    EXPECT_FALSE(cfg.LoadFile(Write(R"({"UdasPort": "0"})")).is_ok());
    EXPECT_FALSE(cfg.LoadFile(Write(R"({"HaltMemtool": 1})")).is_ok());
    EXPECT_FALSE(cfg.LoadFile(Write(R"({"TempRoot": 5})")).is_ok());
}

TEST_F(ConfigParserTests, UnknownLogLevelRejected) {
    FlashToolConfigFromFile cfg;
    auto res = cfg.LoadFile(Write(R"({"LogLevel": "chatty"})"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("chatty"), std::string::npos) << res.msg;
}

} // namespace
} // namespace aurix::config
