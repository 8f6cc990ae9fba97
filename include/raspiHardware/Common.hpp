#ifndef MATRIX_CONTROLLER_RASPIHARDWARE_COMMON_HPP
#define MATRIX_CONTROLLER_RASPIHARDWARE_COMMON_HPP
#include <cstdint>
#include <string>
#include <tcb/span.hpp>
using tcb::span; // This is here to make it easier for us to transition to c++20 span

constexpr uint8_t I2C_Block_Max = 32; // SMBus limit for a single block transfer

inline std::string I2CDevicePath(uint8_t busNum)
{
    return "/dev/i2c-" + std::to_string(busNum);
}

#endif // MATRIX_CONTROLLER_RASPIHARDWARE_COMMON_HPP
