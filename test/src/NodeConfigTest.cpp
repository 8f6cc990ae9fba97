#include "matrix_controller/utils/NodeConfig.hpp"
#include "gtest/gtest.h"
#include <cstdio>
#include <fstream>

using namespace matrix_controller;
using nlohmann::json;

namespace
{
TEST(NodeConfigTest, EmptyObjectGivesDefaults)
{
    auto config = NodeConfigFromJson(json::object());
    EXPECT_EQ(config.Bus, 1);
    EXPECT_EQ(config.Address, 0x08);
    EXPECT_EQ(config.TimeoutSeconds, 20);
    EXPECT_EQ(config.StatusPeriodMs, 100u);
    EXPECT_EQ(config.CommandTimeoutMs, 1000u);
    EXPECT_EQ(config.LogLevel, "info");
    EXPECT_FALSE(config.ServoSpeeds.has_value());
    EXPECT_FALSE(config.MotorModes.has_value());
}

TEST(NodeConfigTest, ParsesAllKeys)
{
    auto j = json::parse(R"({
        "bus": 3,
        "address": 9,
        "timeout_s": 0,
        "status_period_ms": 20,
        "command_timeout_ms": 500,
        "log_level": "debug",
        "servo_speeds": [0, 1, 2, 255],
        "motor_modes": [
            {"mode": "power_float"},
            {"mode": "power_brake", "invert": true},
            {"mode": "speed"},
            {"mode": "slew_to_position", "invert": false}
        ]
    })");
    auto config = NodeConfigFromJson(j);
    EXPECT_EQ(config.Bus, 3);
    EXPECT_EQ(config.Address, 9);
    EXPECT_EQ(config.TimeoutSeconds, 0);
    EXPECT_EQ(config.StatusPeriodMs, 20u);
    EXPECT_EQ(config.CommandTimeoutMs, 500u);
    EXPECT_EQ(config.LogLevel, "debug");
    ASSERT_TRUE(config.ServoSpeeds.has_value());
    EXPECT_EQ(config.ServoSpeeds->at(3), 255);
    ASSERT_TRUE(config.MotorModes.has_value());
    EXPECT_EQ(config.MotorModes->at(0).Mode, MotorMode::PowerFloat);
    EXPECT_FALSE(config.MotorModes->at(0).Invert);
    EXPECT_EQ(config.MotorModes->at(1).Mode, MotorMode::PowerBrake);
    EXPECT_TRUE(config.MotorModes->at(1).Invert);
    EXPECT_EQ(config.MotorModes->at(3).Mode, MotorMode::SlewToPosition);
}

TEST(NodeConfigTest, RejectsBadValues)
{
    EXPECT_THROW((void)NodeConfigFromJson(json::array()), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"address", 128}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"address", -1}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"timeout_s", 256}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"bus", "1"}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"status_period_ms", 0}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"log_level", "loud"}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"servo_speeds", {1, 2, 3}}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json{{"servo_speeds", {1, 2, 3, 300}}}), std::runtime_error);
    EXPECT_THROW((void)NodeConfigFromJson(json::parse(R"({"motor_modes": [{"mode": "fast"}, {}, {}, {}]})")),
                 std::runtime_error);
}

TEST(NodeConfigTest, ErrorNamesTheKey)
{
    try
    {
        (void)NodeConfigFromJson(json{{"command_timeout_ms", "soon"}});
        FAIL() << "Expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("command_timeout_ms"), std::string::npos);
    }
}

TEST(NodeConfigTest, LoadFromFile)
{
    std::string path = ::testing::TempDir() + "matrix_controller_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"bus": 0, "log_level": "warn"})";
    }
    auto config = LoadNodeConfig(path);
    EXPECT_EQ(config.Bus, 0);
    EXPECT_EQ(config.LogLevel, "warn");

    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW((void)LoadNodeConfig(path), std::runtime_error);
    std::remove(path.c_str());
    EXPECT_THROW((void)LoadNodeConfig(path), std::runtime_error);
}
} // namespace
