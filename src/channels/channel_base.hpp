#pragma once

#include <string>
#include <vector>

#include "bus/events.hpp"
#include "bus/message_bus.hpp"

namespace tfbot::channels {

class ChannelBase {
public:
    ChannelBase(std::string name,
                tfbot::bus::MessageBus& bus,
                std::vector<std::string> allow_from);
    virtual ~ChannelBase() = default;
    virtual std::string Name() const { return name_; }
    virtual void Start() = 0;
    virtual void Stop() = 0;

    // Accepts a bare id or "id|username".
    bool IsAllowed(const std::string& sender_id) const;

    // Publishes the event unless the author is filtered out.
    bool HandleEvent(const tfbot::bus::InboundEvent& event, const std::string& sender_key);

    bool IsRunning() const { return running_; }

protected:
    std::string name_;
    tfbot::bus::MessageBus& bus_;
    std::vector<std::string> allow_from_;
    bool running_ = false;
};

}  // namespace tfbot::channels
