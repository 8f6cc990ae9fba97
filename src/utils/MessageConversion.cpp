#include "matrix_controller/utils/MessageConversion.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace matrix_controller
{
namespace
{
std::optional<ServoCommand> ProtobufServoCmdToServoCmd(const matrix_interface::ServoCmd &cmd)
{
    auto id = cmd.servo_id();
    if (id < 1 || id > Num_Servos)
    {
        spdlog::error("Invalid servo index received in servo command, index: {}", id);
        return std::nullopt;
    }
    if (!matrix_interface::ServoCmd_EnableType_IsValid(cmd.enable()))
    {
        spdlog::error("Invalid enable value {} for servo {}", static_cast<int>(cmd.enable()), id);
        return std::nullopt;
    }
    ServoCommand servoCmd;
    servoCmd.Servo = static_cast<uint8_t>(id);
    servoCmd.Enable = ProtoEnableToServoEnable(cmd.enable());
    if (cmd.has_speed())
    {
        if (cmd.speed() > 255)
        {
            spdlog::error("Servo {} speed {} out of range", id, cmd.speed());
            return std::nullopt;
        }
        servoCmd.Speed = static_cast<uint8_t>(cmd.speed());
    }
    if (cmd.has_target())
    {
        if (cmd.target() > Servo_Target_Max)
        {
            spdlog::error("Servo {} target {} out of range", id, cmd.target());
            return std::nullopt;
        }
        servoCmd.Target = static_cast<uint8_t>(cmd.target());
    }
    return servoCmd;
}

std::optional<MotorCommand> ProtobufMotorCmdToMotorCmd(const matrix_interface::MotorCmd &cmd)
{
    auto id = cmd.motor_id();
    if (id < 1 || id > Num_Motors)
    {
        spdlog::error("Invalid motor index received in motor command, index: {}", id);
        return std::nullopt;
    }
    MotorCommand motorCmd;
    motorCmd.Motor = static_cast<uint8_t>(id);
    if (cmd.has_mode())
    {
        const auto &mode = cmd.mode();
        if (!matrix_interface::MotorModeCmd_ModeType_IsValid(mode.mode()))
        {
            spdlog::error("Invalid mode {} for motor {}", static_cast<int>(mode.mode()), id);
            return std::nullopt;
        }
        motorCmd.Mode = MotorModeCommand{ProtoModeToMotorMode(mode.mode()), mode.invert(), mode.pending(), mode.reset()};
    }
    if (cmd.has_speed())
    {
        if (cmd.speed() < -Motor_Speed_Max || cmd.speed() > Motor_Speed_Max)
        {
            spdlog::error("Motor {} speed {} out of range", id, cmd.speed());
            return std::nullopt;
        }
        motorCmd.Speed = static_cast<int8_t>(cmd.speed());
    }
    if (cmd.has_target())
        motorCmd.Target = cmd.target();
    return motorCmd;
}
} // namespace

ServoEnable ProtoEnableToServoEnable(matrix_interface::ServoCmd_EnableType enable)
{
    using matrix_interface::ServoCmd_EnableType;
    switch (enable)
    {
    case ServoCmd_EnableType::ServoCmd_EnableType_KEEP:
        return ServoEnable::Keep;
    case ServoCmd_EnableType::ServoCmd_EnableType_DISABLE:
        return ServoEnable::Disable;
    case ServoCmd_EnableType::ServoCmd_EnableType_ENABLE:
        return ServoEnable::Enable;
    default:
        throw std::runtime_error("Invalid protobuf servo enable received");
    }
}

MotorMode ProtoModeToMotorMode(matrix_interface::MotorModeCmd_ModeType mode)
{
    using matrix_interface::MotorModeCmd_ModeType;
    switch (mode)
    {
    case MotorModeCmd_ModeType::MotorModeCmd_ModeType_POWER_FLOAT:
        return MotorMode::PowerFloat;
    case MotorModeCmd_ModeType::MotorModeCmd_ModeType_POWER_BRAKE:
        return MotorMode::PowerBrake;
    case MotorModeCmd_ModeType::MotorModeCmd_ModeType_SPEED:
        return MotorMode::Speed;
    case MotorModeCmd_ModeType::MotorModeCmd_ModeType_SLEW_TO_POSITION:
        return MotorMode::SlewToPosition;
    default:
        throw std::runtime_error("Invalid protobuf motor mode received");
    }
}

matrix_interface::MotorStatus_ModeType MotorModeToProto(MotorMode mode)
{
    using matrix_interface::MotorStatus_ModeType;
    switch (mode)
    {
    case MotorMode::PowerFloat:
        return MotorStatus_ModeType::MotorStatus_ModeType_POWER_FLOAT;
    case MotorMode::PowerBrake:
        return MotorStatus_ModeType::MotorStatus_ModeType_POWER_BRAKE;
    case MotorMode::Speed:
        return MotorStatus_ModeType::MotorStatus_ModeType_SPEED;
    case MotorMode::SlewToPosition:
        return MotorStatus_ModeType::MotorStatus_ModeType_SLEW_TO_POSITION;
    }
    throw std::runtime_error("Invalid motor mode");
}

std::optional<ControllerCommand> ProtobufCmdMsgToControllerCmd(const matrix_interface::MatrixCmdMsg &protoCmd)
{
    ControllerCommand cmd;
    cmd.MessageId = protoCmd.message_id();
    cmd.StartMotors = protoCmd.start_motors();
    for (const auto &servo : protoCmd.servos())
    {
        auto servoCmd = ProtobufServoCmdToServoCmd(servo);
        if (!servoCmd.has_value())
            return std::nullopt;
        cmd.Servos.push_back(*servoCmd);
    }
    for (const auto &motor : protoCmd.motors())
    {
        auto motorCmd = ProtobufMotorCmdToMotorCmd(motor);
        if (!motorCmd.has_value())
            return std::nullopt;
        cmd.Motors.push_back(*motorCmd);
    }
    return cmd;
}

std::optional<ControllerCommand> AcceptCmdMsg(const matrix_interface::MatrixCmdMsg &protoCmd,
                                              CommandWatchdog &watchdog, CommandWatchdog::Clock::time_point now)
{
    auto cmd = ProtobufCmdMsgToControllerCmd(protoCmd);
    if (cmd.has_value())
        watchdog.Feed(now);
    return cmd;
}

matrix_interface::MatrixStatusMsg SnapshotToProto(const ControllerSnapshot &snapshot, const ControllerInfo &info)
{
    matrix_interface::MatrixStatusMsg statusMsg;
    statusMsg.set_version(info.Version);
    statusMsg.set_manufacturer(info.Manufacturer);
    statusMsg.set_controller_type(info.ControllerType);
    statusMsg.set_battery_low(snapshot.Status.BatteryLow);
    statusMsg.set_fault(snapshot.Status.Fault);
    statusMsg.set_battery_level(snapshot.Status.BatteryLevel);
    statusMsg.set_battery_voltage(snapshot.Status.BatteryVoltage());
    statusMsg.set_timeout(snapshot.Timeout);
    for (bool enabled : snapshot.ServoEnabled)
    {
        statusMsg.add_servo_enabled(enabled);
    }
    for (uint32_t i = 0; i < Num_Motors; i++)
    {
        const auto &motor = snapshot.Motors.at(i);
        auto motorPtr = statusMsg.mutable_motors()->Add();
        motorPtr->set_motor_id(i + 1);
        motorPtr->set_position(motor.Position);
        motorPtr->set_target(motor.Target);
        motorPtr->set_speed(motor.Speed);
        motorPtr->set_busy(motor.Busy);
        motorPtr->set_invert(motor.Invert);
        motorPtr->set_pending(motor.Pending);
        motorPtr->set_mode(MotorModeToProto(motor.Mode));
    }
    return statusMsg;
}
} // namespace matrix_controller
