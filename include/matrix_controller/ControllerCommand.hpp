#ifndef MATRIX_CONTROLLER_CONTROLLERCOMMAND_HPP
#define MATRIX_CONTROLLER_CONTROLLERCOMMAND_HPP
#include "matrix_controller/InterfaceData.hpp"
#include "matrix_controller/utils/CommandWatchdog.hpp"
#include <optional>
#include <vector>

namespace matrix_controller
{
class MatrixController;

struct ServoCommand
{
    uint8_t Servo{1};
    ServoEnable Enable{ServoEnable::Keep};
    std::optional<uint8_t> Speed{};
    std::optional<uint8_t> Target{};
};

struct MotorModeCommand
{
    MotorMode Mode{MotorMode::PowerFloat};
    bool Invert{false};
    bool Pending{false};
    bool Reset{false};
};

struct MotorCommand
{
    uint8_t Motor{1};
    std::optional<MotorModeCommand> Mode{};
    std::optional<int8_t> Speed{};
    std::optional<int32_t> Target{};
};

struct ControllerCommand
{
    uint32_t MessageId{0};
    std::vector<ServoCommand> Servos{};
    std::vector<MotorCommand> Motors{};
    bool StartMotors{false};
};

// Everything that can be read back from the controller in one poll
struct ControllerSnapshot
{
    ControllerStatus Status{};
    uint8_t Timeout{0};
    std::array<bool, Num_Servos> ServoEnabled{};
    std::array<MotorStatus, Num_Motors> Motors{};
};

/**
 * Writes a command to the controller.
 * Servo enables are merged into one register write, then servo speed/target, motor mode, motor target and motor
 * speed are written per channel. The start flag is written last so pending motors start together.
 */
void ApplyControllerCommand(MatrixController &controller, const ControllerCommand &cmd);

[[nodiscard]] ControllerSnapshot ReadControllerSnapshot(MatrixController &controller);

/**
 * Stops all motors when the watchdog has tripped. Returns true when the motors were stopped.
 * If the stop write fails the watchdog is re-armed so the next call tries again, and the bus error is rethrown.
 */
bool StopMotorsOnCommandTimeout(MatrixController &controller, CommandWatchdog &watchdog,
                                CommandWatchdog::Clock::time_point now = CommandWatchdog::Clock::now());
} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_CONTROLLERCOMMAND_HPP
