#ifndef MATRIX_CONTROLLER_TEST_DUMMYRPII2CDRIVER_HPP
#define MATRIX_CONTROLLER_TEST_DUMMYRPII2CDRIVER_HPP
#include "raspiHardware/I2C.hpp"
#include <array>
#include <stdexcept>
#include <utility>
#include <vector>

namespace matrix_controller_test
{
// Register file of a single device, every transfer is recorded
class DummyRpiI2CDriver : public RpiI2CDriver
{
  public:
    enum class Op
    {
        ReadByte,
        WriteByte,
        ReadBlock,
        WriteBlock
    };
    struct Transaction
    {
        Op op;
        uint8_t addr;
        uint8_t reg;
        std::vector<uint8_t> data;
    };

    explicit DummyRpiI2CDriver(uint8_t addr = 0x08) : addr_(addr){};

    uint8_t ReadByteData(uint8_t addr, uint8_t reg) override
    {
        Check(addr);
        uint8_t val = registers_[reg];
        transactions_.push_back(Transaction{Op::ReadByte, addr, reg, {val}});
        return val;
    };
    void WriteByteData(uint8_t addr, uint8_t reg, uint8_t value) override
    {
        Check(addr);
        registers_[reg] = value;
        transactions_.push_back(Transaction{Op::WriteByte, addr, reg, {value}});
    };
    void ReadBlockData(uint8_t addr, uint8_t reg, span<uint8_t> rxBuf) override
    {
        Check(addr);
        for (size_t i = 0; i < rxBuf.size(); i++)
        {
            rxBuf[i] = registers_[(reg + i) & 0xFF];
        }
        transactions_.push_back(Transaction{Op::ReadBlock, addr, reg, {rxBuf.begin(), rxBuf.end()}});
    };
    void WriteBlockData(uint8_t addr, uint8_t reg, span<const uint8_t> txBuf) override
    {
        Check(addr);
        for (size_t i = 0; i < txBuf.size(); i++)
        {
            registers_[(reg + i) & 0xFF] = txBuf[i];
        }
        transactions_.push_back(Transaction{Op::WriteBlock, addr, reg, {txBuf.begin(), txBuf.end()}});
    };

    void SetRegister(uint8_t reg, uint8_t val)
    {
        registers_[reg] = val;
    }
    void SetRegisters(uint8_t reg, const std::vector<uint8_t> &vals)
    {
        for (size_t i = 0; i < vals.size(); i++)
        {
            registers_[(reg + i) & 0xFF] = vals[i];
        }
    }
    [[nodiscard]] uint8_t GetRegister(uint8_t reg) const
    {
        return registers_[reg];
    }
    void SetFailing(bool failing)
    {
        failing_ = failing;
    }
    [[nodiscard]] const std::vector<Transaction> &GetTransactions() const
    {
        return transactions_;
    }
    [[nodiscard]] size_t CountWrites() const
    {
        size_t count = 0;
        for (const auto &t : transactions_)
        {
            if (t.op == Op::WriteByte || t.op == Op::WriteBlock)
                count++;
        }
        return count;
    }
    void ClearTransactions()
    {
        transactions_.clear();
    }

  private:
    void Check(uint8_t addr) const
    {
        if (failing_)
            throw std::runtime_error("Remote I/O error");
        if (addr != addr_)
            throw std::runtime_error("No device at address");
    }
    uint8_t addr_;
    bool failing_{false};
    std::array<uint8_t, 256> registers_{};
    std::vector<Transaction> transactions_{};
};
} // namespace matrix_controller_test
#endif
