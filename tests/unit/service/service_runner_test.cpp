/// @file service_runner_test.cpp
/// @brief Unit tests for entry-point helpers.

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "msim/service/service_runner.hpp"

using namespace msim::service;
using msim::foundation::ConfigManager;

namespace {

std::filesystem::path writeConfig(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

// ===========================================================================
// CLI parsing
// ===========================================================================

TEST(ServiceRunnerTest, ParseOptionFindsValue) {
    char prog[] = "mob_sim_server";
    char flag[] = "--ticks";
    char value[] = "200";
    char* argv[] = {prog, flag, value};

    auto ticks = parseOptionArg(3, argv, "--ticks");
    ASSERT_TRUE(ticks.has_value());
    EXPECT_EQ(*ticks, "200");
    EXPECT_FALSE(parseOptionArg(3, argv, "--config").has_value());
}

TEST(ServiceRunnerTest, TrailingFlagWithoutValueIgnored) {
    char prog[] = "mob_sim_server";
    char flag[] = "--config";
    char* argv[] = {prog, flag};

    EXPECT_TRUE(parseConfigArg(2, argv).empty());
}

TEST(ServiceRunnerTest, ParseConfigArg) {
    char prog[] = "mob_sim_server";
    char flag[] = "--config";
    char value[] = "config/mobs.yaml";
    char* argv[] = {prog, flag, value};

    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("config/mobs.yaml"));
}

// ===========================================================================
// Config loading
// ===========================================================================

TEST(ServiceRunnerTest, LoadConfigFromDefaultPath) {
    unsetenv("MSIM_CONFIG_PATH");
    auto path = writeConfig("msim_runner_default.yaml", "server:\n  tick_rate: 30\n");

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path));
    EXPECT_EQ(config.getOr<int>("server.tick_rate", 0), 30);

    std::filesystem::remove(path);
}

TEST(ServiceRunnerTest, EnvironmentOverridesDefaultPath) {
    auto path = writeConfig("msim_runner_env.yaml", "server:\n  tick_rate: 40\n");
    setenv("MSIM_CONFIG_PATH", path.c_str(), 1);

    ConfigManager config;
    auto result = loadConfig(config, "/nonexistent/msim/mobs.yaml");
    unsetenv("MSIM_CONFIG_PATH");

    ASSERT_TRUE(result);
    EXPECT_EQ(config.getOr<int>("server.tick_rate", 0), 40);
    std::filesystem::remove(path);
}

TEST(ServiceRunnerTest, MissingConfigFails) {
    unsetenv("MSIM_CONFIG_PATH");
    ConfigManager config;
    EXPECT_FALSE(loadConfig(config, "/nonexistent/msim/mobs.yaml"));
}

// ===========================================================================
// SignalHandler
// ===========================================================================

TEST(SignalHandlerTest, RequestShutdownRaisesFlag) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
    SignalHandler::requestShutdown();
    EXPECT_TRUE(signals.shutdownRequested());
    signals.waitForShutdown();
}

// ===========================================================================
// Headless tick count
// ===========================================================================

TEST(ServiceRunnerTest, TickCountDefaultsToZero) {
    char prog[] = "mob_sim_server";
    char* argv[] = {prog};

    auto ticks = parseTickCountArg(1, argv);
    ASSERT_TRUE(ticks);
    EXPECT_EQ(ticks.value(), 0u);
}

TEST(ServiceRunnerTest, TickCountParsed) {
    char prog[] = "mob_sim_server";
    char flag[] = "--ticks";
    char value[] = "1200";
    char* argv[] = {prog, flag, value};

    auto ticks = parseTickCountArg(3, argv);
    ASSERT_TRUE(ticks);
    EXPECT_EQ(ticks.value(), 1200u);
}

TEST(ServiceRunnerTest, MalformedTickCountRejected) {
    char prog[] = "mob_sim_server";
    char flag[] = "--ticks";
    char value[] = "12x";
    char* argv[] = {prog, flag, value};

    auto ticks = parseTickCountArg(3, argv);
    ASSERT_FALSE(ticks);
    EXPECT_EQ(ticks.error().code(), msim::foundation::ErrorCode::InvalidArgument);
    ASSERT_NE(ticks.error().context<std::string>(), nullptr);
    EXPECT_EQ(*ticks.error().context<std::string>(), "12x");
}
