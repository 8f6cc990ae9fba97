#ifndef MATRIX_CONTROLLER_CONTROLLERNODE_HPP
#define MATRIX_CONTROLLER_CONTROLLERNODE_HPP
#include <cstdint>
#include <memory>
class RpiI2CDriver;
namespace matrix_controller
{
struct NodeConfig;
// Bridges one controller to eCAL: "matrix_cmd" in, "matrix_status" out
class ControllerNode
{
  public:
    class Impl;
    ControllerNode(std::shared_ptr<RpiI2CDriver> i2c, const NodeConfig &config);
    ~ControllerNode();
    std::unique_ptr<Impl> impl_;
};
} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_CONTROLLERNODE_HPP
