#include "coordinator/lifecycle.hpp"

namespace tfbot::coordinator {

const char* ToString(LifecycleState state) {
    switch (state) {
        case LifecycleState::kArrived: return "ARRIVED";
        case LifecycleState::kDedupRejected: return "DEDUP_REJECTED";
        case LifecycleState::kDedupAccepted: return "DEDUP_ACCEPTED";
        case LifecycleState::kRejected: return "REJECTED";
        case LifecycleState::kThreadResolving: return "THREAD_RESOLVING";
        case LifecycleState::kThreadReady: return "THREAD_READY";
        case LifecycleState::kProcessing: return "PROCESSING";
        case LifecycleState::kDelivering: return "DELIVERING";
        case LifecycleState::kDelivered: return "DELIVERED";
        case LifecycleState::kFailed: return "FAILED";
    }
    return "UNKNOWN";
}

bool IsTerminal(LifecycleState state) {
    return state == LifecycleState::kDedupRejected
        || state == LifecycleState::kRejected
        || state == LifecycleState::kDelivered
        || state == LifecycleState::kFailed;
}

bool IsValidTransition(LifecycleState from, LifecycleState to) {
    switch (from) {
        case LifecycleState::kArrived:
            return to == LifecycleState::kDedupRejected || to == LifecycleState::kDedupAccepted;
        case LifecycleState::kDedupAccepted:
            return to == LifecycleState::kRejected || to == LifecycleState::kThreadResolving;
        case LifecycleState::kThreadResolving:
            return to == LifecycleState::kThreadReady;
        case LifecycleState::kThreadReady:
            return to == LifecycleState::kProcessing;
        case LifecycleState::kProcessing:
            return to == LifecycleState::kDelivering || to == LifecycleState::kFailed;
        case LifecycleState::kDelivering:
            return to == LifecycleState::kDelivered || to == LifecycleState::kFailed;
        case LifecycleState::kDedupRejected:
        case LifecycleState::kRejected:
        case LifecycleState::kDelivered:
        case LifecycleState::kFailed:
            return false;
    }
    return false;
}

}  // namespace tfbot::coordinator
