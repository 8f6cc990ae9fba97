#ifndef MATRIX_CONTROLLER_I2C_HPP
#define MATRIX_CONTROLLER_I2C_HPP
#include "Common.hpp"
#include <cstdint>

// Register level access to devices on one I2C bus.
// Addresses are 7-bit slave addresses, registers are 8-bit command codes.
class RpiI2CDriver
{
  public:
    virtual ~RpiI2CDriver() = default;
    virtual uint8_t ReadByteData(uint8_t addr, uint8_t reg) = 0;
    virtual void WriteByteData(uint8_t addr, uint8_t reg, uint8_t value) = 0;
    // Reads rxBuf.size() consecutive registers starting at reg
    virtual void ReadBlockData(uint8_t addr, uint8_t reg, span<uint8_t> rxBuf) = 0;
    virtual void WriteBlockData(uint8_t addr, uint8_t reg, span<const uint8_t> txBuf) = 0;
};
#endif // MATRIX_CONTROLLER_I2C_HPP
