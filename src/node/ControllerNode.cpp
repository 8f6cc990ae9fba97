#include "matrix_controller/node/ControllerNode.hpp"
#include "matrix_controller/ControllerCommand.hpp"
#include "matrix_controller/MatrixController.hpp"
#include "matrix_controller/utils/CommandWatchdog.hpp"
#include "matrix_controller/utils/MessageConversion.hpp"
#include "matrix_controller/utils/NodeConfig.hpp"
#include "raspiHardware/I2C.hpp"
#include <atomic>
#include <chrono>
#include <ecal/ecal.h>
#include <ecal/msg/protobuf/publisher.h>
#include <ecal/msg/protobuf/subscriber.h>
#include <matrix_controller_protobuf/matrix_cmd_msg.pb.h>
#include <matrix_controller_protobuf/matrix_status_msg.pb.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>
using namespace std::chrono;
using namespace std::chrono_literals;
using eCAL::protobuf::CPublisher;
using eCAL::protobuf::CSubscriber;
namespace matrix_controller
{
class ControllerNode::Impl
{
  public:
    Impl(std::shared_ptr<RpiI2CDriver> &&i2c, const NodeConfig &config);
    ~Impl();

  private:
    void RunLoop();
    void SetConfig(const NodeConfig &config);
    void PublishStatus();
    void OnCmdMsg(const matrix_interface::MatrixCmdMsg &msg);
    std::unique_ptr<CSubscriber<matrix_interface::MatrixCmdMsg>> cmdSub_;
    std::unique_ptr<CPublisher<matrix_interface::MatrixStatusMsg>> statusPub_;
    MatrixController controller_;
    ControllerInfo info_{};
    CommandWatchdog watchdog_;
    milliseconds statusPeriod_;
    std::thread runThread_;
    std::mutex i2cMutex_;
    std::atomic<bool> stopRequested_{false};
    uint32_t statusMessageId_{0};
};

ControllerNode::Impl::Impl(std::shared_ptr<RpiI2CDriver> &&i2c, const NodeConfig &config)
    : cmdSub_(std::make_unique<CSubscriber<matrix_interface::MatrixCmdMsg>>("matrix_cmd")),
      statusPub_(std::make_unique<CPublisher<matrix_interface::MatrixStatusMsg>>("matrix_status")),
      controller_(std::move(i2c), config.Address), watchdog_(milliseconds(config.CommandTimeoutMs)),
      statusPeriod_(config.StatusPeriodMs)
{
    SetConfig(config);
    cmdSub_->AddReceiveCallback([this](auto * /*topicName*/, const auto &msg, auto /*time*/, auto /*clock*/,
                                       auto /*id*/) { OnCmdMsg(msg); });
    runThread_ = std::thread([&]() { RunLoop(); });
}

ControllerNode::Impl::~Impl()
{
    stopRequested_ = true;
    runThread_.join();
    cmdSub_->RemReceiveCallback();
    try
    {
        std::lock_guard lock(i2cMutex_);
        controller_.StopAllMotors();
    }
    catch (const std::exception &e)
    {
        spdlog::error("Failed to stop motors on shutdown: {}", e.what());
    }
}

void ControllerNode::Impl::SetConfig(const NodeConfig &config)
{
    std::lock_guard lock(i2cMutex_);
    info_ = controller_.GetInfo();
    spdlog::info("Controller at 0x{:02X}: version '{}', manufacturer '{}', type '{}'", controller_.Address(),
                 info_.Version, info_.Manufacturer, info_.ControllerType);
    if (!MatrixController::IsExpectedDevice(info_))
        spdlog::warn("Device at 0x{:02X} does not identify as a Matrix servo/motor controller", controller_.Address());

    auto timeout = controller_.SetTimeout(config.TimeoutSeconds);
    if (timeout != config.TimeoutSeconds)
        spdlog::warn("Controller timeout reads back {}s, expected {}s", timeout, config.TimeoutSeconds);

    if (config.ServoSpeeds.has_value())
    {
        for (uint8_t i = 0; i < Num_Servos; i++)
        {
            controller_.SetServoSpeed(i + 1, config.ServoSpeeds->at(i));
        }
    }
    if (config.MotorModes.has_value())
    {
        for (uint8_t i = 0; i < Num_Motors; i++)
        {
            const auto &mode = config.MotorModes->at(i);
            controller_.SetMotorMode(i + 1, mode.Invert, false, false, mode.Mode);
        }
    }
    auto status = controller_.GetStatus();
    spdlog::info("Battery {:.2f}V{}{}", status.BatteryVoltage(), status.BatteryLow ? ", battery low" : "",
                 status.Fault ? ", fault" : "");
}

void ControllerNode::Impl::OnCmdMsg(const matrix_interface::MatrixCmdMsg &msg)
{
    auto cmd = AcceptCmdMsg(msg, watchdog_);
    if (!cmd.has_value())
    {
        spdlog::warn("Dropping invalid command message {}", msg.message_id());
        return;
    }
    spdlog::debug("Command message {}: {} servo, {} motor commands", cmd->MessageId, cmd->Servos.size(),
                  cmd->Motors.size());
    try
    {
        std::lock_guard lock(i2cMutex_);
        ApplyControllerCommand(controller_, *cmd);
    }
    catch (const std::exception &e)
    {
        spdlog::error("Failed to apply command message {}: {}", cmd->MessageId, e.what());
    }
}

void ControllerNode::Impl::PublishStatus()
{
    ControllerSnapshot snapshot;
    {
        std::lock_guard lock(i2cMutex_);
        snapshot = ReadControllerSnapshot(controller_);
    }
    auto statusMsg = SnapshotToProto(snapshot, info_);
    statusMsg.set_message_id(statusMessageId_++);
    statusMsg.set_time_ns(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
    statusPub_->Send(statusMsg);
}

void ControllerNode::Impl::RunLoop()
{
    auto next = steady_clock::now() + 50ms;
    while (!stopRequested_)
    {
        std::this_thread::sleep_until(next);
        if (stopRequested_)
            return;
        next = next + statusPeriod_;
        if (steady_clock::now() > next)
        {
            spdlog::debug("Status loop overran its period");
            next = steady_clock::now();
        }
        try
        {
            std::lock_guard lock(i2cMutex_);
            if (StopMotorsOnCommandTimeout(controller_, watchdog_))
                spdlog::warn("No command received in time, stopped motors");
        }
        catch (const std::exception &e)
        {
            spdlog::error("Failed to stop motors after command timeout, retrying: {}", e.what());
        }
        try
        {
            PublishStatus();
        }
        catch (const std::exception &e)
        {
            spdlog::error("Controller poll failed: {}", e.what());
        }
    }
}

ControllerNode::ControllerNode(std::shared_ptr<RpiI2CDriver> i2c, const NodeConfig &config)
{
    impl_ = std::make_unique<Impl>(std::move(i2c), config);
}

ControllerNode::~ControllerNode() = default;

} // namespace matrix_controller
