#include "matrix_controller/ControllerCommand.hpp"
#include "matrix_controller/MatrixController.hpp"
#include <stdexcept>

namespace matrix_controller
{

void ApplyControllerCommand(MatrixController &controller, const ControllerCommand &cmd)
{
    std::array<ServoEnable, Num_Servos> enables{ServoEnable::Keep, ServoEnable::Keep, ServoEnable::Keep,
                                                ServoEnable::Keep};
    bool enableChanged = false;
    for (const auto &servo : cmd.Servos)
    {
        if (servo.Enable == ServoEnable::Keep)
            continue;
        enables.at(servo.Servo - 1) = servo.Enable;
        enableChanged = true;
    }
    if (enableChanged)
        controller.SetServos(enables);

    for (const auto &servo : cmd.Servos)
    {
        if (servo.Speed.has_value())
            controller.SetServoSpeed(servo.Servo, *servo.Speed);
        if (servo.Target.has_value())
            controller.SetServoTarget(servo.Servo, *servo.Target);
    }

    for (const auto &motor : cmd.Motors)
    {
        if (motor.Mode.has_value())
            controller.SetMotorMode(motor.Motor, motor.Mode->Invert, motor.Mode->Pending, motor.Mode->Reset,
                                    motor.Mode->Mode);
        if (motor.Target.has_value())
            controller.SetMotorTarget(motor.Motor, *motor.Target);
        if (motor.Speed.has_value())
            controller.SetMotorSpeed(motor.Motor, *motor.Speed);
    }

    if (cmd.StartMotors)
        controller.StartMotors();
}

ControllerSnapshot ReadControllerSnapshot(MatrixController &controller)
{
    ControllerSnapshot snapshot;
    snapshot.Status = controller.GetStatus();
    snapshot.Timeout = controller.GetTimeout();
    snapshot.ServoEnabled = controller.GetServos();
    for (uint8_t i = 0; i < Num_Motors; i++)
    {
        snapshot.Motors.at(i) = controller.GetMotorStatus(i + 1);
    }
    return snapshot;
}

bool StopMotorsOnCommandTimeout(MatrixController &controller, CommandWatchdog &watchdog,
                                CommandWatchdog::Clock::time_point now)
{
    if (!watchdog.CheckExpired(now))
        return false;
    try
    {
        controller.StopAllMotors();
    }
    catch (const std::exception &)
    {
        watchdog.Rearm();
        throw;
    }
    return true;
}

} // namespace matrix_controller
