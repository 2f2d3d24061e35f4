#include "channels/channel_base.hpp"

#include <algorithm>
#include <utility>

#include "utils/logging.hpp"

namespace tfbot::channels {

ChannelBase::ChannelBase(std::string name,
                         tfbot::bus::MessageBus& bus,
                         std::vector<std::string> allow_from)
    : name_(std::move(name))
    , bus_(bus)
    , allow_from_(std::move(allow_from)) {}

bool ChannelBase::IsAllowed(const std::string& sender_id) const {
    if (allow_from_.empty()) {
        return true;
    }
    const auto listed = [this](const std::string& candidate) {
        return !candidate.empty()
            && std::find(allow_from_.begin(), allow_from_.end(), candidate) != allow_from_.end();
    };
    if (listed(sender_id)) {
        return true;
    }
    // "id|username": either half may be listed.
    const auto pipe = sender_id.find('|');
    return pipe != std::string::npos
        && (listed(sender_id.substr(0, pipe)) || listed(sender_id.substr(pipe + 1)));
}

bool ChannelBase::HandleEvent(const tfbot::bus::InboundEvent& event, const std::string& sender_key) {
    if (!IsAllowed(sender_key)) {
        utils::LogInfo(name_, "event " + event.event_id + " blocked by allowFrom: " + sender_key);
        return false;
    }
    bus_.PublishInbound(event);
    return true;
}

}  // namespace tfbot::channels
