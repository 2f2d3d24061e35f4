#pragma once

#include <chrono>

namespace tfbot::utils {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
    virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    TimePoint Now() const override;
    void SleepFor(std::chrono::milliseconds duration) override;
};

Clock& DefaultClock();

}  // namespace tfbot::utils
