#include "ratelimit/rate_limiter.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "utils/logging.hpp"

namespace tfbot::ratelimit {
namespace {

constexpr const char* kTag = "ratelimit";
constexpr auto kWindow = std::chrono::seconds(60);
constexpr auto kCleanupInterval = std::chrono::hours(1);
constexpr auto kIdleAggressive = std::chrono::minutes(30);
constexpr auto kIdleNormal = std::chrono::hours(1);

int CeilSeconds(utils::Clock::TimePoint::duration d) {
    const auto ms = std::chrono::ceil<std::chrono::milliseconds>(d).count();
    return std::max(1, static_cast<int>((ms + 999) / 1000));
}

}  // namespace

RateLimiter::RateLimiter(RateLimitConfig config, utils::Clock& clock)
    : config_(std::move(config))
    , clock_(clock)
    , last_cleanup_(clock.Now()) {}

RateLimitDecision RateLimiter::Check(const std::string& user_id) {
    if (!config_.enabled) {
        return {};
    }
    const auto now = clock_.Now();
    std::lock_guard<std::mutex> lock(mutex_);

    if (users_.size() > config_.max_users_tracked) {
        CleanupLocked(now, true);
        last_cleanup_ = now;
    } else if (now - last_cleanup_ > kCleanupInterval) {
        CleanupLocked(now, false);
        last_cleanup_ = now;
    }

    auto it = users_.find(user_id);
    if (it != users_.end()) {
        auto& state = it->second;
        const auto cooldown = std::chrono::seconds(config_.cooldown_s);
        const auto since_last = now - state.last_request;
        if (since_last < cooldown) {
            return {true, CeilSeconds(cooldown - since_last), "cooldown"};
        }
        while (!state.recent.empty() && state.recent.front() <= now - kWindow) {
            state.recent.pop_front();
        }
        if (static_cast<int>(state.recent.size()) >= config_.max_per_minute) {
            return {true, CeilSeconds(state.recent.front() + kWindow - now), "max_per_minute"};
        }
    }

    auto& state = users_[user_id];
    state.last_request = now;
    state.recent.push_back(now);
    return {};
}

std::size_t RateLimiter::TrackedUsers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

void RateLimiter::CleanupLocked(utils::Clock::TimePoint now, bool aggressive) {
    const auto threshold = now - (aggressive ? utils::Clock::TimePoint::duration(kIdleAggressive)
                                             : utils::Clock::TimePoint::duration(kIdleNormal));
    const auto before = users_.size();
    for (auto it = users_.begin(); it != users_.end();) {
        if (it->second.last_request < threshold) {
            it = users_.erase(it);
        } else {
            ++it;
        }
    }
    const auto idle_removed = before - users_.size();

    if (aggressive && users_.size() > config_.max_users_tracked) {
        std::vector<std::pair<utils::Clock::TimePoint, std::string>> by_age;
        by_age.reserve(users_.size());
        for (const auto& [id, state] : users_) {
            by_age.emplace_back(state.last_request, id);
        }
        std::sort(by_age.begin(), by_age.end());
        const auto to_remove = users_.size() - config_.max_users_tracked / 2;
        for (std::size_t i = 0; i < to_remove; ++i) {
            users_.erase(by_age[i].second);
        }
        utils::LogWarn(kTag, "aggressive cleanup removed " + std::to_string(to_remove)
            + " additional users");
    }

    if (idle_removed > 0) {
        utils::LogInfo(kTag, std::string(aggressive ? "aggressive" : "normal")
            + " cleanup removed " + std::to_string(idle_removed)
            + " idle users, tracking " + std::to_string(users_.size()));
    }
}

}  // namespace tfbot::ratelimit
