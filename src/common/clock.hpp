#pragma once

#include <chrono>

namespace mirulog {

// Time source and the single place where pipeline code blocks.
// Tests substitute a manual clock so schedules and backoff run instantly.
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual std::chrono::steady_clock::time_point monotonicNow() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override;
    std::chrono::steady_clock::time_point monotonicNow() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

} // namespace mirulog
