#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>

#include "utils/clock.hpp"

namespace tfbot::utils {

struct PollOptions {
    std::chrono::milliseconds initial_interval{200};
    double multiplier = 1.5;
    std::chrono::milliseconds max_interval{2000};
    std::chrono::milliseconds timeout{5000};
};

// Sleeps, then looks up, until the lookup yields a value or the timeout elapses.
// The interval grows by `multiplier` up to `max_interval`; no sleep runs past
// the deadline. Exceptions from the lookup propagate to the caller.
template <typename T>
std::optional<T> PollUntil(const std::function<std::optional<T>()>& lookup,
                           const PollOptions& options,
                           Clock& clock) {
    const auto deadline = clock.Now() + options.timeout;
    auto interval = std::max(options.initial_interval, std::chrono::milliseconds(1));
    while (true) {
        const auto now = clock.Now();
        if (now >= deadline) {
            return std::nullopt;
        }
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        clock.SleepFor(std::min(interval, remaining));
        if (auto value = lookup()) {
            return value;
        }
        const auto grown = std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(interval.count()) * options.multiplier));
        interval = std::min(std::max(grown, interval), options.max_interval);
    }
}

}  // namespace tfbot::utils
