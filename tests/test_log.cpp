#include <gtest/gtest.h>
#include "common/log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace agentrelay;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "agent-relay-log-test.log";
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        log::shutdown();
        std::filesystem::remove(path_);
    }

    std::filesystem::path path_;
};

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(log::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(log::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(log::parse_level("err"), spdlog::level::err);
    EXPECT_EQ(log::parse_level("crit"), spdlog::level::critical);
    EXPECT_EQ(log::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(log::parse_level("loud"), spdlog::level::info);
}

TEST_F(LogTest, ChannelNames) {
    EXPECT_EQ(log::channel_name(log::MAIN_LOGGER), "agent-relay");
    EXPECT_EQ(log::channel_name(log::RELAY_LOGGER), "relay");
    EXPECT_EQ(log::channel(log::UPSTREAM_LOGGER)->name(), "upstream");
}

TEST_F(LogTest, ChannelsShareFileSinkAndLevel) {
    log::LogConfig config;
    config.console = false;
    config.file_path = path_.string();
    config.level = spdlog::level::info;
    log::init(config);

    NLOG_INFO(log::RELAY_LOGGER, "relay line {}", 1);
    NLOG_WARN(log::AUTH_LOGGER, "auth line {}", 2);
    NLOG_DEBUG(log::HTTP_LOGGER, "filtered line");
    log::shutdown();

    auto contents = read_file(path_);
    EXPECT_NE(contents.find("[relay] [info]"), std::string::npos);
    EXPECT_NE(contents.find("relay line 1"), std::string::npos);
    EXPECT_NE(contents.find("[auth] [warning]"), std::string::npos);
    EXPECT_EQ(contents.find("filtered line"), std::string::npos);
}

TEST_F(LogTest, ReinitAppliesNewLevel) {
    log::LogConfig config;
    config.console = false;
    config.file_path = path_.string();
    config.level = spdlog::level::err;
    log::init(config);
    NLOG_INFO(log::CONFIG_LOGGER, "before reinit");

    config.level = spdlog::level::debug;
    log::init(config);
    NLOG_DEBUG(log::CONFIG_LOGGER, "after reinit");
    log::shutdown();

    auto contents = read_file(path_);
    EXPECT_EQ(contents.find("before reinit"), std::string::npos);
    EXPECT_NE(contents.find("after reinit"), std::string::npos);
}
