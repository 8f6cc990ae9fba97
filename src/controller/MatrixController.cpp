#include "matrix_controller/MatrixController.hpp"
#include "raspiHardware/I2C.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace matrix_controller
{
namespace
{
std::string ReadInfoString(RpiI2CDriver &i2c, uint8_t address, uint8_t reg)
{
    std::array<uint8_t, Register::InfoLength> buf{};
    i2c.ReadBlockData(address, reg, span<uint8_t>(buf.data(), buf.size()));
    return std::string(buf.begin(), buf.end());
}
} // namespace

MatrixController::MatrixController(std::shared_ptr<RpiI2CDriver> i2c, uint8_t address)
    : i2c_(std::move(i2c)), address_(address)
{
    if (!i2c_)
        throw std::invalid_argument("MatrixController needs an I2C driver");
    if (address_ > 0x7F)
        throw std::invalid_argument(fmt::format("I2C address 0x{:02X} is not a 7 bit address", address_));
}

void MatrixController::CheckServo(uint8_t servo)
{
    if (servo < 1 || servo > Num_Servos)
        throw std::invalid_argument(fmt::format("Servo channel must be 1 to {}, got {}", Num_Servos, servo));
}

void MatrixController::CheckMotor(uint8_t motor)
{
    if (motor < 1 || motor > Num_Motors)
        throw std::invalid_argument(fmt::format("Motor channel must be 1 to {}, got {}", Num_Motors, motor));
}

ControllerInfo MatrixController::GetInfo()
{
    ControllerInfo info;
    info.Version = ReadInfoString(*i2c_, address_, Register::Version);
    info.Manufacturer = ReadInfoString(*i2c_, address_, Register::Manufacturer);
    info.ControllerType = ReadInfoString(*i2c_, address_, Register::ControllerType);
    return info;
}

bool MatrixController::IsExpectedDevice(const ControllerInfo &info)
{
    return info.Manufacturer == "HiTechnc" && info.ControllerType == "M4S4cont";
}

ControllerStatus MatrixController::GetStatus()
{
    ControllerStatus status;
    uint8_t statusByte = i2c_->ReadByteData(address_, Register::Status);
    status.BatteryLow = statusByte & Status_BatteryLow;
    status.Fault = statusByte & Status_Fault;
    status.BatteryLevel = i2c_->ReadByteData(address_, Register::Battery);
    return status;
}

uint8_t MatrixController::SetTimeout(int32_t seconds)
{
    if (seconds < KeepCurrent || seconds > 255)
        throw std::invalid_argument(fmt::format("Timeout must be in the range [-1, 255], got {}", seconds));

    if (seconds != KeepCurrent)
        i2c_->WriteByteData(address_, Register::Timeout, static_cast<uint8_t>(seconds));
    return i2c_->ReadByteData(address_, Register::Timeout);
}

uint8_t MatrixController::GetTimeout()
{
    return SetTimeout(KeepCurrent);
}

void MatrixController::StartMotors()
{
    i2c_->WriteByteData(address_, Register::StartFlag, 1);
}

std::array<bool, Num_Servos> MatrixController::SetServos(const std::array<ServoEnable, Num_Servos> &servos)
{
    uint8_t val = i2c_->ReadByteData(address_, Register::ServoEnable);
    for (uint8_t i = 0; i < Num_Servos; i++)
    {
        switch (servos[i])
        {
        case ServoEnable::Keep:
            break;
        case ServoEnable::Disable:
            val &= ~(0b1u << i);
            break;
        case ServoEnable::Enable:
            val |= 0b1u << i;
            break;
        default:
            throw std::invalid_argument(fmt::format("Servo element {} has an inappropriate value {}", i,
                                                    static_cast<int>(servos[i])));
        }
    }
    i2c_->WriteByteData(address_, Register::ServoEnable, val);
    return GetServos();
}

std::array<bool, Num_Servos> MatrixController::GetServos()
{
    uint8_t val = i2c_->ReadByteData(address_, Register::ServoEnable);
    std::array<bool, Num_Servos> enabled{};
    for (uint8_t i = 0; i < Num_Servos; i++)
    {
        enabled[i] = val & (0b1u << i);
    }
    return enabled;
}

uint8_t MatrixController::SetServoSpeed(uint8_t servo, int32_t speed)
{
    CheckServo(servo);
    if (speed < KeepCurrent || speed > 255)
        throw std::invalid_argument(fmt::format("Servo speed must be in the range [-1, 255], got {}", speed));

    if (speed != KeepCurrent)
        i2c_->WriteByteData(address_, ServoSpeedRegister(servo), static_cast<uint8_t>(speed));
    return i2c_->ReadByteData(address_, ServoSpeedRegister(servo));
}

uint8_t MatrixController::SetServoTarget(uint8_t servo, int32_t target)
{
    CheckServo(servo);
    if (target < KeepCurrent || target > Servo_Target_Max)
        throw std::invalid_argument(
            fmt::format("Servo target must be in the range [-1, {}], got {}", Servo_Target_Max, target));

    if (target != KeepCurrent)
        i2c_->WriteByteData(address_, ServoTargetRegister(servo), static_cast<uint8_t>(target));
    return i2c_->ReadByteData(address_, ServoTargetRegister(servo));
}

MotorStatus MatrixController::GetMotorStatus(uint8_t motor)
{
    CheckMotor(motor);
    std::array<uint8_t, 4> position{}, target{};
    i2c_->ReadBlockData(address_, MotorRegister(motor, Register::MotorPosition),
                        span<uint8_t>(position.data(), position.size()));
    i2c_->ReadBlockData(address_, MotorRegister(motor, Register::MotorTarget),
                        span<uint8_t>(target.data(), target.size()));
    uint8_t speed = i2c_->ReadByteData(address_, MotorRegister(motor, Register::MotorSpeed));
    uint8_t mode = i2c_->ReadByteData(address_, MotorRegister(motor, Register::MotorMode));

    auto decoded = DecodeModeByte(mode);
    MotorStatus status;
    status.Position = Int32FromBigEndian(span<const uint8_t, 4>(position.data(), position.size()));
    status.Target = Int32FromBigEndian(span<const uint8_t, 4>(target.data(), target.size()));
    status.Speed = ByteToInt8(speed);
    status.Busy = decoded.Busy;
    status.Invert = decoded.Invert;
    status.Pending = decoded.Pending;
    status.Mode = decoded.Mode;
    return status;
}

void MatrixController::SetMotorMode(uint8_t motor, bool invert, bool pending, bool reset, MotorMode mode)
{
    CheckMotor(motor);
    if (static_cast<uint8_t>(mode) > static_cast<uint8_t>(MotorMode::SlewToPosition))
        throw std::invalid_argument(fmt::format("Motor mode must be 0 to 3, got {}", static_cast<int>(mode)));

    i2c_->WriteByteData(address_, MotorRegister(motor, Register::MotorMode), ModeByte(invert, pending, reset, mode));
}

void MatrixController::SetMotorSpeed(uint8_t motor, int32_t speed)
{
    CheckMotor(motor);
    if (speed < -Motor_Speed_Max || speed > Motor_Speed_Max)
        throw std::invalid_argument(fmt::format("Motor speed must be in the range [-100, 100], got {}", speed));

    i2c_->WriteByteData(address_, MotorRegister(motor, Register::MotorSpeed), Int8ToByte(static_cast<int8_t>(speed)));
}

void MatrixController::SetMotorTarget(uint8_t motor, int32_t target)
{
    CheckMotor(motor);
    auto bytes = BigEndianFromInt32(target);
    i2c_->WriteBlockData(address_, MotorRegister(motor, Register::MotorTarget),
                         span<const uint8_t>(bytes.data(), bytes.size()));
}

void MatrixController::StopAllMotors()
{
    for (uint8_t motor = 1; motor <= Num_Motors; motor++)
    {
        SetMotorSpeed(motor, 0);
    }
    spdlog::debug("Stopped all motors on controller 0x{:02X}", address_);
}

} // namespace matrix_controller
