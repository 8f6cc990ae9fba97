#include "raspiHardware/SMBusI2C.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>

namespace matrix_controller
{

SMBusI2C::SMBusI2C(uint8_t busNum) : devicePath_(I2CDevicePath(busNum))
{
    fd_ = open(devicePath_.c_str(), O_RDWR);
    if (fd_ < 0)
    {
        throw std::runtime_error(fmt::format("Can't open {}: {}", devicePath_, std::strerror(errno)));
    }
    spdlog::debug("Opened {}", devicePath_);
}

SMBusI2C::~SMBusI2C()
{
    if (fd_ >= 0)
        close(fd_);
}

void SMBusI2C::SelectSlave(uint8_t addr)
{
    if (currentAddr_ == addr)
        return;
    if (ioctl(fd_, I2C_SLAVE, static_cast<unsigned long>(addr)) < 0)
    {
        throw std::runtime_error(
            fmt::format("Failed to select slave 0x{:02X} on {}: {}", addr, devicePath_, std::strerror(errno)));
    }
    currentAddr_ = addr;
}

void SMBusI2C::Transfer(uint8_t addr, uint8_t readWrite, uint8_t reg, uint32_t size, void *data)
{
    SelectSlave(addr);
    i2c_smbus_ioctl_data args{};
    args.read_write = readWrite;
    args.command = reg;
    args.size = size;
    args.data = reinterpret_cast<i2c_smbus_data *>(data);
    if (ioctl(fd_, I2C_SMBUS, &args) < 0)
    {
        throw std::runtime_error(fmt::format("SMBus {} failed on {} addr 0x{:02X} reg 0x{:02X}: {}",
                                             readWrite == I2C_SMBUS_READ ? "read" : "write", devicePath_, addr, reg,
                                             std::strerror(errno)));
    }
}

uint8_t SMBusI2C::ReadByteData(uint8_t addr, uint8_t reg)
{
    std::lock_guard lock(busMutex_);
    i2c_smbus_data data{};
    Transfer(addr, I2C_SMBUS_READ, reg, I2C_SMBUS_BYTE_DATA, &data);
    return data.byte;
}

void SMBusI2C::WriteByteData(uint8_t addr, uint8_t reg, uint8_t value)
{
    std::lock_guard lock(busMutex_);
    i2c_smbus_data data{};
    data.byte = value;
    Transfer(addr, I2C_SMBUS_WRITE, reg, I2C_SMBUS_BYTE_DATA, &data);
}

void SMBusI2C::ReadBlockData(uint8_t addr, uint8_t reg, span<uint8_t> rxBuf)
{
    if (rxBuf.empty() || rxBuf.size() > I2C_Block_Max)
    {
        throw std::invalid_argument(fmt::format("Block read length must be 1 to {}, got {}", I2C_Block_Max, rxBuf.size()));
    }
    std::lock_guard lock(busMutex_);
    i2c_smbus_data data{};
    // block[0] holds the length, the kernel fills block[1..]
    data.block[0] = static_cast<uint8_t>(rxBuf.size());
    Transfer(addr, I2C_SMBUS_READ, reg, I2C_SMBUS_I2C_BLOCK_DATA, &data);
    std::memcpy(rxBuf.data(), &data.block[1], rxBuf.size());
}

void SMBusI2C::WriteBlockData(uint8_t addr, uint8_t reg, span<const uint8_t> txBuf)
{
    if (txBuf.empty() || txBuf.size() > I2C_Block_Max)
    {
        throw std::invalid_argument(fmt::format("Block write length must be 1 to {}, got {}", I2C_Block_Max, txBuf.size()));
    }
    std::lock_guard lock(busMutex_);
    i2c_smbus_data data{};
    data.block[0] = static_cast<uint8_t>(txBuf.size());
    std::memcpy(&data.block[1], txBuf.data(), txBuf.size());
    Transfer(addr, I2C_SMBUS_WRITE, reg, I2C_SMBUS_I2C_BLOCK_DATA, &data);
}

} // namespace matrix_controller
