#include "common/clock.hpp"

#include <thread>

namespace mirulog {

std::chrono::system_clock::time_point SystemClock::now() const
{
    return std::chrono::system_clock::now();
}

std::chrono::steady_clock::time_point SystemClock::monotonicNow() const
{
    return std::chrono::steady_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration)
{
    if (duration.count() <= 0) {
        return;
    }
    std::this_thread::sleep_for(duration);
}

} // namespace mirulog
