#ifndef MATRIX_CONTROLLER_UTILS_NODECONFIG_HPP
#define MATRIX_CONTROLLER_UTILS_NODECONFIG_HPP
#include "matrix_controller/InterfaceData.hpp"
#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace matrix_controller
{
struct MotorStartupConfig
{
    MotorMode Mode{MotorMode::PowerBrake};
    bool Invert{false};
};

struct NodeConfig
{
    uint8_t Bus{1};
    uint8_t Address{Default_Address};
    uint8_t TimeoutSeconds{20};      // hardware shutdown timeout written at startup
    uint32_t StatusPeriodMs{100};
    uint32_t CommandTimeoutMs{1000}; // motors are stopped when commands stop for this long
    std::string LogLevel{"info"};
    std::optional<std::array<uint8_t, Num_Servos>> ServoSpeeds{};
    std::optional<std::array<MotorStartupConfig, Num_Motors>> MotorModes{};
};

/**
 * Missing keys keep their defaults, a key with the wrong type or an out of range value throws std::runtime_error
 * naming the key.
 *
 * @code
 * {
 *     "bus": 1,
 *     "address": 8,
 *     "timeout_s": 20,
 *     "status_period_ms": 100,
 *     "command_timeout_ms": 1000,
 *     "log_level": "info",
 *     "servo_speeds": [0, 0, 10, 10],
 *     "motor_modes": [{"mode": "speed", "invert": false}, ...]
 * }
 * @endcode
 */
[[nodiscard]] NodeConfig NodeConfigFromJson(const nlohmann::json &j);

[[nodiscard]] NodeConfig LoadNodeConfig(const std::string &path);

[[nodiscard]] MotorMode MotorModeFromString(const std::string &mode);

} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_UTILS_NODECONFIG_HPP
