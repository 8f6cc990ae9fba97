#ifndef MATRIX_CONTROLLER_INTERFACEDATA_HPP
#define MATRIX_CONTROLLER_INTERFACEDATA_HPP

#include <array>
#include <cstdint>
#include <string>
#include <tcb/span.hpp>
using tcb::span;

namespace matrix_controller
{
constexpr uint8_t Default_Address = 0x08;
constexpr uint8_t Num_Servos = 4;
constexpr uint8_t Num_Motors = 4;

namespace Register
{
constexpr uint8_t Version = 0x00;
constexpr uint8_t Manufacturer = 0x08;
constexpr uint8_t ControllerType = 0x10;
constexpr uint8_t Status = 0x41;
constexpr uint8_t Timeout = 0x42;
constexpr uint8_t Battery = 0x43;
constexpr uint8_t StartFlag = 0x44;
constexpr uint8_t ServoEnable = 0x45;
constexpr uint8_t ServoBase = 0x46; // speed, target pairs for servo 1..4
constexpr uint8_t MotorBase = 0x4E; // 10 byte blocks for motor 1..4

constexpr uint8_t ServoWidth = 2;
constexpr uint8_t MotorWidth = 10;
constexpr uint8_t InfoLength = 8;

// Offsets inside a motor block
constexpr uint8_t MotorPosition = 0;
constexpr uint8_t MotorTarget = 4;
constexpr uint8_t MotorSpeed = 8;
constexpr uint8_t MotorMode = 9;
} // namespace Register

// Channel numbers are 1 based, matching the labels on the board
constexpr uint8_t ServoSpeedRegister(uint8_t servo)
{
    return Register::ServoBase + (servo - 1) * Register::ServoWidth;
}

constexpr uint8_t ServoTargetRegister(uint8_t servo)
{
    return ServoSpeedRegister(servo) + 1;
}

constexpr uint8_t MotorRegister(uint8_t motor, uint8_t offset)
{
    return Register::MotorBase + (motor - 1) * Register::MotorWidth + offset;
}

static_assert(ServoSpeedRegister(4) == 0x4C);
static_assert(MotorRegister(2, 0) == 0x58);
static_assert(MotorRegister(3, 0) == 0x62);
static_assert(MotorRegister(4, 0) == 0x6C);
static_assert(MotorRegister(4, Register::MotorMode) == 0x75);

constexpr uint8_t Status_Fault = 0b1;
constexpr uint8_t Status_BatteryLow = 0b10;
constexpr double Battery_Volts_Per_Level = 0.040;

constexpr uint8_t Servo_Target_Max = 250; // 0.75ms - 2.25ms pulse over 0 - 250
constexpr int8_t Motor_Speed_Max = 100;

enum class MotorMode : uint8_t
{
    PowerFloat = 0b00, // 0 speed lets the motor float
    PowerBrake = 0b01, // 0 speed brakes the motor
    Speed = 0b10,
    SlewToPosition = 0b11
};

struct ModeBits
{
    static constexpr uint8_t Mode = 0b11;
    static constexpr uint8_t Reset = 0b1 << 2;
    static constexpr uint8_t Pending = 0b1 << 3;
    static constexpr uint8_t Invert = 0b1 << 4;
    static constexpr uint8_t Busy = 0b1 << 7; // read only, set while slewing to target
};

enum class ServoEnable : int8_t
{
    Keep = -1,
    Disable = 0,
    Enable = 1
};

struct ControllerInfo
{
    std::string Version;
    std::string Manufacturer;
    std::string ControllerType;
};

struct ControllerStatus
{
    bool BatteryLow{false};
    bool Fault{false};
    uint8_t BatteryLevel{0}; // units of 40mV

    [[nodiscard]] double BatteryVoltage() const
    {
        return BatteryLevel * Battery_Volts_Per_Level;
    }
};

struct MotorStatus
{
    int32_t Position{0}; // encoder counts
    int32_t Target{0};   // encoder counts
    int8_t Speed{0};     // -100 to 100
    bool Busy{false};
    bool Invert{false};
    bool Pending{false};
    MotorMode Mode{MotorMode::PowerFloat};
};

struct DecodedMode
{
    bool Busy;
    bool Invert;
    bool Pending;
    MotorMode Mode;
};

inline uint8_t Int8ToByte(int8_t value)
{
    return static_cast<uint8_t>(value);
}

inline int8_t ByteToInt8(uint8_t byte)
{
    if (!(byte & 0x80))
        return static_cast<int8_t>(byte);
    return static_cast<int8_t>(-static_cast<int16_t>((byte ^ 0xFF) + 1));
}

// Encoder registers hold the most significant byte first
inline int32_t Int32FromBigEndian(span<const uint8_t, 4> bytes)
{
    uint32_t value = static_cast<uint32_t>(bytes[0]) << 24 | static_cast<uint32_t>(bytes[1]) << 16 |
                     static_cast<uint32_t>(bytes[2]) << 8 | static_cast<uint32_t>(bytes[3]);
    return static_cast<int32_t>(value);
}

inline std::array<uint8_t, 4> BigEndianFromInt32(int32_t value)
{
    auto raw = static_cast<uint32_t>(value);
    return {static_cast<uint8_t>(raw >> 24), static_cast<uint8_t>(raw >> 16), static_cast<uint8_t>(raw >> 8),
            static_cast<uint8_t>(raw)};
}

inline uint8_t ModeByte(bool invert, bool pending, bool reset, MotorMode mode)
{
    uint8_t byte = static_cast<uint8_t>(mode) & ModeBits::Mode;
    if (invert)
        byte |= ModeBits::Invert;
    if (pending)
        byte |= ModeBits::Pending;
    if (reset)
        byte |= ModeBits::Reset;
    return byte;
}

inline DecodedMode DecodeModeByte(uint8_t byte)
{
    return DecodedMode{static_cast<bool>(byte & ModeBits::Busy), static_cast<bool>(byte & ModeBits::Invert),
                       static_cast<bool>(byte & ModeBits::Pending), static_cast<MotorMode>(byte & ModeBits::Mode)};
}

} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_INTERFACEDATA_HPP
