#include "bus/message_bus.hpp"

namespace tfbot::bus {

void MessageBus::PublishInbound(const InboundEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push(event);
    }
    cv_.notify_one();
}

bool MessageBus::TryConsumeInbound(InboundEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !inbound_.empty() || stopped_; })) {
        return false;
    }
    if (inbound_.empty()) {
        return false;
    }
    event = inbound_.front();
    inbound_.pop();
    return true;
}

std::size_t MessageBus::InboundSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbound_.size();
}

void MessageBus::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

}  // namespace tfbot::bus
