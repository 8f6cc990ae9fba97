#ifndef MATRIX_CONTROLLER_UTILS_MESSAGECONVERSION_HPP
#define MATRIX_CONTROLLER_UTILS_MESSAGECONVERSION_HPP
#include <cstdint>
#include <matrix_controller/ControllerCommand.hpp>
#include <matrix_controller/utils/CommandWatchdog.hpp>
#include <matrix_controller_protobuf/matrix_cmd_msg.pb.h>
#include <matrix_controller_protobuf/matrix_status_msg.pb.h>
#include <optional>

namespace matrix_controller
{
[[nodiscard]] ServoEnable ProtoEnableToServoEnable(matrix_interface::ServoCmd_EnableType enable);

[[nodiscard]] MotorMode ProtoModeToMotorMode(matrix_interface::MotorModeCmd_ModeType mode);

[[nodiscard]] matrix_interface::MotorStatus_ModeType MotorModeToProto(MotorMode mode);

// Returns nullopt when any channel id or value is out of range, nothing of an invalid message gets applied
[[nodiscard]] std::optional<ControllerCommand> ProtobufCmdMsgToControllerCmd(const matrix_interface::MatrixCmdMsg &protoCmd);

// Converts a received command and feeds the watchdog only when the command is accepted
[[nodiscard]] std::optional<ControllerCommand> AcceptCmdMsg(
    const matrix_interface::MatrixCmdMsg &protoCmd, CommandWatchdog &watchdog,
    CommandWatchdog::Clock::time_point now = CommandWatchdog::Clock::now());

[[nodiscard]] matrix_interface::MatrixStatusMsg SnapshotToProto(const ControllerSnapshot &snapshot,
                                                                const ControllerInfo &info);

} // namespace matrix_controller

#endif // MATRIX_CONTROLLER_UTILS_MESSAGECONVERSION_HPP
