#ifndef MATRIX_CONTROLLER_UTILS_COMMANDWATCHDOG_HPP
#define MATRIX_CONTROLLER_UTILS_COMMANDWATCHDOG_HPP
#include <chrono>
#include <mutex>

namespace matrix_controller
{
// Trips once when commands stop arriving for longer than the timeout, re-arms on the next command
class CommandWatchdog
{
  public:
    using Clock = std::chrono::steady_clock;
    explicit CommandWatchdog(std::chrono::milliseconds timeout) : timeout_(timeout){};

    void Feed(Clock::time_point now = Clock::now())
    {
        std::lock_guard lock(mutex_);
        lastCmdTime_ = now;
        armed_ = true;
    }

    [[nodiscard]] bool CheckExpired(Clock::time_point now = Clock::now())
    {
        std::lock_guard lock(mutex_);
        if (!armed_ || now - lastCmdTime_ <= timeout_)
            return false;
        armed_ = false;
        return true;
    }

    // Trip again on the next check, used when the reaction to a trip failed
    void Rearm()
    {
        std::lock_guard lock(mutex_);
        armed_ = true;
    }

  private:
    std::chrono::milliseconds timeout_;
    Clock::time_point lastCmdTime_{};
    bool armed_{false};
    std::mutex mutex_;
};
} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_UTILS_COMMANDWATCHDOG_HPP
