#include "matrix_controller/MatrixController.hpp"
#include "raspiHardware/SMBusI2C.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

using namespace matrix_controller;

// One shot bring-up check of a controller: prints what it reads back after a few writes
int main(int argc, char *argv[])
{
    uint8_t bus = 1;
    uint8_t address = Default_Address;
    if (argc > 1)
        bus = static_cast<uint8_t>(std::strtoul(argv[1], nullptr, 0));
    if (argc > 2)
        address = static_cast<uint8_t>(std::strtoul(argv[2], nullptr, 0));

    try
    {
        auto i2c = std::make_shared<SMBusI2C>(bus);
        MatrixController matrix(i2c, address);

        auto info = matrix.GetInfo();
        spdlog::info("Info: version '{}', manufacturer '{}', type '{}'", info.Version, info.Manufacturer,
                     info.ControllerType);
        if (!MatrixController::IsExpectedDevice(info))
            spdlog::warn("Unexpected device identity");

        auto status = matrix.GetStatus();
        spdlog::info("Status: battery low {}, fault {}, battery level {} ({:.2f}V)", status.BatteryLow, status.Fault,
                     status.BatteryLevel, status.BatteryVoltage());
        spdlog::info("Timeout: {}s", matrix.SetTimeout(20));

        auto servos =
            matrix.SetServos({ServoEnable::Enable, ServoEnable::Enable, ServoEnable::Disable, ServoEnable::Keep});
        spdlog::info("Servos enabled: {} {} {} {}", servos[0], servos[1], servos[2], servos[3]);
        spdlog::info("Servo 1 speed: {}", matrix.SetServoSpeed(1, 0));
        spdlog::info("Servo 1 target: {}", matrix.SetServoTarget(1, 250));

        matrix.SetMotorMode(1, true, false, true, MotorMode::SlewToPosition);
        auto motor = matrix.GetMotorStatus(1);
        spdlog::info("Motor 1: position {}, target {}, speed {}, busy {}, invert {}, pending {}, mode {}",
                     motor.Position, motor.Target, motor.Speed, motor.Busy, motor.Invert, motor.Pending,
                     static_cast<int>(motor.Mode));
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Probe failed: {}", e.what());
        return 1;
    }
    return 0;
}
