#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

#include "bus/events.hpp"

namespace tfbot::bus {

class MessageBus {
public:
    void PublishInbound(const InboundEvent& event);
    bool TryConsumeInbound(InboundEvent& event, std::chrono::milliseconds timeout);
    std::size_t InboundSize() const;
    void Stop();
    bool IsStopped() const { return stopped_; }

private:
    std::queue<InboundEvent> inbound_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

}  // namespace tfbot::bus
