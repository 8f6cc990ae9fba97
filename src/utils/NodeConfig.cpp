#include "matrix_controller/utils/NodeConfig.hpp"
#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

using nlohmann::json;
namespace matrix_controller
{
namespace
{
template <typename T> T GetUnsigned(const json &j, const char *key, T defaultVal, uint64_t maxVal)
{
    if (!j.contains(key))
        return defaultVal;
    const auto &val = j.at(key);
    if (!val.is_number_integer() || val.get<int64_t>() < 0)
        throw std::runtime_error(fmt::format("Config key '{}' must be a non negative integer", key));
    auto raw = val.get<uint64_t>();
    if (raw > maxVal)
        throw std::runtime_error(fmt::format("Config key '{}' must be at most {}, got {}", key, maxVal, raw));
    return static_cast<T>(raw);
}
} // namespace

MotorMode MotorModeFromString(const std::string &mode)
{
    if (mode == "power_float")
        return MotorMode::PowerFloat;
    if (mode == "power_brake")
        return MotorMode::PowerBrake;
    if (mode == "speed")
        return MotorMode::Speed;
    if (mode == "slew_to_position")
        return MotorMode::SlewToPosition;
    throw std::runtime_error(fmt::format("Unknown motor mode '{}'", mode));
}

NodeConfig NodeConfigFromJson(const json &j)
{
    if (!j.is_object())
        throw std::runtime_error("Config must be a json object");

    NodeConfig config;
    config.Bus = GetUnsigned<uint8_t>(j, "bus", config.Bus, 255);
    config.Address = GetUnsigned<uint8_t>(j, "address", config.Address, 0x7F);
    config.TimeoutSeconds = GetUnsigned<uint8_t>(j, "timeout_s", config.TimeoutSeconds, 255);
    config.StatusPeriodMs = GetUnsigned<uint32_t>(j, "status_period_ms", config.StatusPeriodMs, 60000);
    config.CommandTimeoutMs = GetUnsigned<uint32_t>(j, "command_timeout_ms", config.CommandTimeoutMs, 600000);
    if (config.StatusPeriodMs == 0)
        throw std::runtime_error("Config key 'status_period_ms' must be positive");

    if (j.contains("log_level"))
    {
        if (!j.at("log_level").is_string())
            throw std::runtime_error("Config key 'log_level' must be a string");
        config.LogLevel = j.at("log_level").get<std::string>();
        if (spdlog::level::from_str(config.LogLevel) == spdlog::level::off && config.LogLevel != "off")
            throw std::runtime_error(fmt::format("Config key 'log_level' has unknown level '{}'", config.LogLevel));
    }

    if (j.contains("servo_speeds"))
    {
        const auto &speeds = j.at("servo_speeds");
        if (!speeds.is_array() || speeds.size() != Num_Servos)
            throw std::runtime_error(fmt::format("Config key 'servo_speeds' must be an array of {} values", Num_Servos));
        std::array<uint8_t, Num_Servos> servoSpeeds{};
        for (size_t i = 0; i < Num_Servos; i++)
        {
            if (!speeds[i].is_number_integer() || speeds[i].get<int64_t>() < 0 || speeds[i].get<int64_t>() > 255)
                throw std::runtime_error(fmt::format("Config key 'servo_speeds' element {} must be 0 to 255", i));
            servoSpeeds[i] = speeds[i].get<uint8_t>();
        }
        config.ServoSpeeds = servoSpeeds;
    }

    if (j.contains("motor_modes"))
    {
        const auto &modes = j.at("motor_modes");
        if (!modes.is_array() || modes.size() != Num_Motors)
            throw std::runtime_error(fmt::format("Config key 'motor_modes' must be an array of {} objects", Num_Motors));
        std::array<MotorStartupConfig, Num_Motors> motorModes{};
        for (size_t i = 0; i < Num_Motors; i++)
        {
            const auto &mode = modes[i];
            if (!mode.is_object() || !mode.contains("mode") || !mode.at("mode").is_string())
                throw std::runtime_error(fmt::format("Config key 'motor_modes' element {} needs a 'mode' string", i));
            motorModes[i].Mode = MotorModeFromString(mode.at("mode").get<std::string>());
            if (mode.contains("invert"))
            {
                if (!mode.at("invert").is_boolean())
                    throw std::runtime_error(fmt::format("Config key 'motor_modes' element {} 'invert' must be a bool", i));
                motorModes[i].Invert = mode.at("invert").get<bool>();
            }
        }
        config.MotorModes = motorModes;
    }
    return config;
}

NodeConfig LoadNodeConfig(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error(fmt::format("Failed to open config file {}", path));
    json j;
    try
    {
        file >> j;
    }
    catch (const json::parse_error &e)
    {
        throw std::runtime_error(fmt::format("Failed to parse config file {}: {}", path, e.what()));
    }
    return NodeConfigFromJson(j);
}
} // namespace matrix_controller
