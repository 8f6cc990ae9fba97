#include "matrix_controller/node/ControllerNode.hpp"
#include "matrix_controller/utils/NodeConfig.hpp"
#include "raspiHardware/SMBusI2C.hpp"
#include <ecal/ecal.h>
#include <spdlog/spdlog.h>

using namespace matrix_controller;
int main(int argc, char *argv[])
{
    NodeConfig config;
    try
    {
        if (argc > 1)
            config = LoadNodeConfig(argv[1]);
    }
    catch (const std::exception &e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.LogLevel));

    // initialize eCAL API
    eCAL::Initialize({}, "Matrix Controller");

    // set process state
    eCAL::Process::SetState(proc_sev_healthy, proc_sev_level1, "Matrix Controller");

    int ret = 0;
    try
    {
        auto i2c = std::make_shared<SMBusI2C>(config.Bus);
        auto node = ControllerNode(std::move(i2c), config);
        while (eCAL::Ok())
        {
            eCAL::Process::SleepMS(100);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Matrix controller node failed: {}", e.what());
        ret = 1;
    }

    spdlog::info("FINISHED");
    eCAL::Finalize();
    return ret;
}
