#ifndef MATRIX_CONTROLLER_SMBUSI2C_HPP
#define MATRIX_CONTROLLER_SMBUSI2C_HPP
#include "I2C.hpp"
#include <mutex>
#include <string>

namespace matrix_controller
{
// I2C access through the Linux i2c-dev interface (/dev/i2c-N), using SMBus transfers
class SMBusI2C : public RpiI2CDriver
{
  public:
    explicit SMBusI2C(uint8_t busNum);
    ~SMBusI2C() override;
    SMBusI2C(const SMBusI2C &) = delete;
    SMBusI2C &operator=(const SMBusI2C &) = delete;

    uint8_t ReadByteData(uint8_t addr, uint8_t reg) override;
    void WriteByteData(uint8_t addr, uint8_t reg, uint8_t value) override;
    void ReadBlockData(uint8_t addr, uint8_t reg, span<uint8_t> rxBuf) override;
    void WriteBlockData(uint8_t addr, uint8_t reg, span<const uint8_t> txBuf) override;

  private:
    void SelectSlave(uint8_t addr);
    void Transfer(uint8_t addr, uint8_t readWrite, uint8_t reg, uint32_t size, void *data);
    std::string devicePath_;
    int fd_{-1};
    int currentAddr_{-1};
    std::mutex busMutex_;
};
} // namespace matrix_controller

#endif // MATRIX_CONTROLLER_SMBUSI2C_HPP
