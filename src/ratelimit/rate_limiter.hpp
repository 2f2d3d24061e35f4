#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include "utils/clock.hpp"

namespace tfbot::ratelimit {

struct RateLimitConfig {
    bool enabled = true;
    int cooldown_s = 10;
    int max_per_minute = 6;
    std::size_t max_users_tracked = 10000;
};

struct RateLimitDecision {
    bool limited = false;
    int retry_after_s = 0;
    std::string reason;
};

// Per-user cooldown plus a trailing one-minute window. Denied requests are
// not counted against the user.
class RateLimiter {
public:
    RateLimiter(RateLimitConfig config, utils::Clock& clock);

    RateLimitDecision Check(const std::string& user_id);

    std::size_t TrackedUsers() const;

private:
    struct UserState {
        utils::Clock::TimePoint last_request;
        std::deque<utils::Clock::TimePoint> recent;
    };

    void CleanupLocked(utils::Clock::TimePoint now, bool aggressive);

    RateLimitConfig config_;
    utils::Clock& clock_;
    std::unordered_map<std::string, UserState> users_;
    utils::Clock::TimePoint last_cleanup_;
    mutable std::mutex mutex_;
};

}  // namespace tfbot::ratelimit
