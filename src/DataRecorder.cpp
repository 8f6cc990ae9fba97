#include <ctime>
#include <ecal/ecal.h>
#include <ecal/msg/protobuf/subscriber.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <matrix_controller/utils/StatusDatabase.hpp>
#include <matrix_controller_protobuf/matrix_status_msg.pb.h>
#include <memory>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <string>

using namespace eCAL::protobuf;
using matrix_controller::StatusDatabase;

// Stores every "matrix_status" message into a sqlite database named after the start time
class StatusRecorder
{
  public:
    explicit StatusRecorder(const std::string &dbName);
    ~StatusRecorder();

  private:
    void StatusMsgCb(const char *, const matrix_interface::MatrixStatusMsg &msg, long long, long long, long long);
    StatusDatabase database_;
    std::unique_ptr<CSubscriber<matrix_interface::MatrixStatusMsg>> statusSub_;
};

StatusRecorder::StatusRecorder(const std::string &dbName)
    : database_(dbName),
      statusSub_(std::make_unique<CSubscriber<matrix_interface::MatrixStatusMsg>>("matrix_status"))
{
    spdlog::info("Recording to {}", dbName);
    statusSub_->AddReceiveCallback(
        [this](auto a, const auto &b, auto c, auto d, auto e) { this->StatusMsgCb(a, b, c, d, e); });
}

StatusRecorder::~StatusRecorder()
{
    statusSub_->RemReceiveCallback();
}

void StatusRecorder::StatusMsgCb(const char * /*topic_name_*/, const matrix_interface::MatrixStatusMsg &msg,
                                 long long /*time_*/, long long /*clock_*/, long long /*id_*/)
{
    try
    {
        database_.Insert(msg);
    }
    catch (const std::exception &e)
    {
        spdlog::error("{}", e.what());
    }
}

namespace
{
volatile sig_atomic_t isInt = 0;
void SigIntHandler(int)
{
    isInt = 1;
}
} // namespace

int main()
{
    signal(SIGINT, SigIntHandler);
    // initialize eCAL API
    eCAL::Initialize({}, "Matrix Data Recorder");

    // set process state
    eCAL::Process::SetState(proc_sev_healthy, proc_sev_level1, "Matrix Data Recorder");

    int ret = 0;
    try
    {
        std::time_t t = std::time(nullptr);
        StatusRecorder recorder(fmt::format("{:%Y_%m_%d_%H%M%S}.db", *std::localtime(&t)));
        while (eCAL::Ok() && !isInt)
        {
            eCAL::Process::SleepMS(100);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Data recorder failed: {}", e.what());
        ret = 1;
    }
    spdlog::info("Ending");
    eCAL::Finalize();
    return ret;
}
