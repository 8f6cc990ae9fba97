#ifndef MATRIX_CONTROLLER_MATRIXCONTROLLER_HPP
#define MATRIX_CONTROLLER_MATRIXCONTROLLER_HPP
#include "matrix_controller/InterfaceData.hpp"
#include <array>
#include <cstdint>
#include <memory>
class RpiI2CDriver;
namespace matrix_controller
{
/**
 * Register level access to one Matrix servo/motor controller.
 *
 * Servo and motor channels are numbered 1 to 4. Out of range arguments throw std::invalid_argument before anything
 * is written, bus failures propagate from the driver as std::runtime_error.
 * For the setters taking a -1 sentinel, -1 leaves the register untouched and only reads it back.
 */
class MatrixController
{
  public:
    static constexpr int32_t KeepCurrent = -1;

    MatrixController(std::shared_ptr<RpiI2CDriver> i2c, uint8_t address = Default_Address);

    [[nodiscard]] ControllerInfo GetInfo();
    [[nodiscard]] static bool IsExpectedDevice(const ControllerInfo &info);
    [[nodiscard]] ControllerStatus GetStatus();

    /**
     * Sets the timeout for automatic servo/motor shutdown
     * @param seconds -1 to 255
     * @return timeout read back from the controller
     */
    uint8_t SetTimeout(int32_t seconds);
    [[nodiscard]] uint8_t GetTimeout();

    // Starts motors waiting on the pending flag
    void StartMotors();

    /**
     * Enables or disables servo pulse generation, Keep leaves a servo as it is
     * @return enabled state of each servo read back after the write
     */
    std::array<bool, Num_Servos> SetServos(const std::array<ServoEnable, Num_Servos> &servos);
    [[nodiscard]] std::array<bool, Num_Servos> GetServos();

    /**
     * Rate at which the servo moves to a new target. 0 is immediate, otherwise each step takes 10 * speed ms
     * @param servo 1 to 4
     * @param speed -1 to 255
     * @return speed read back from the controller
     */
    uint8_t SetServoSpeed(uint8_t servo, int32_t speed);

    /**
     * Servo position, 0 to 250 maps to a 0.75ms to 2.25ms pulse
     * @param servo 1 to 4
     * @param target -1 to 250
     * @return target read back from the controller
     */
    uint8_t SetServoTarget(uint8_t servo, int32_t target);

    [[nodiscard]] MotorStatus GetMotorStatus(uint8_t motor);
    void SetMotorMode(uint8_t motor, bool invert, bool pending, bool reset, MotorMode mode);
    // speed is -100 to 100
    void SetMotorSpeed(uint8_t motor, int32_t speed);
    // Encoder target used in slew to position mode
    void SetMotorTarget(uint8_t motor, int32_t target);
    void StopAllMotors();

    [[nodiscard]] uint8_t Address() const
    {
        return address_;
    }

  private:
    static void CheckServo(uint8_t servo);
    static void CheckMotor(uint8_t motor);
    std::shared_ptr<RpiI2CDriver> i2c_;
    uint8_t address_;
};
} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_MATRIXCONTROLLER_HPP
