#include "utils/clock.hpp"

#include <thread>

namespace tfbot::utils {

Clock::TimePoint SystemClock::Now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::SleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }
    std::this_thread::sleep_for(duration);
}

Clock& DefaultClock() {
    static SystemClock clock;
    return clock;
}

}  // namespace tfbot::utils
