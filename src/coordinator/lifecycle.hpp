#pragma once

#include <optional>
#include <string>

#include "platform/platform.hpp"

namespace tfbot::coordinator {

enum class LifecycleState {
    kArrived,
    kDedupRejected,
    kDedupAccepted,
    kRejected,
    kThreadResolving,
    kThreadReady,
    kProcessing,
    kDelivering,
    kDelivered,
    kFailed
};

const char* ToString(LifecycleState state);

bool IsTerminal(LifecycleState state);

// ARRIVED -> DEDUP_REJECTED | DEDUP_ACCEPTED
// DEDUP_ACCEPTED -> REJECTED | THREAD_RESOLVING -> THREAD_READY -> PROCESSING
// PROCESSING -> DELIVERING | FAILED, DELIVERING -> DELIVERED | FAILED
bool IsValidTransition(LifecycleState from, LifecycleState to);

struct LifecycleResult {
    std::string event_id;
    LifecycleState state = LifecycleState::kArrived;
    // Unset when the reply went to the originating channel.
    std::optional<platform::Thread> thread;
    std::optional<platform::MessageHandle> first_handle;
    std::string error;
};

}  // namespace tfbot::coordinator
