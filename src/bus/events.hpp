#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tfbot::bus {

enum class EventKind {
    kMention,
    kSlashCommand,
    kThreadReply
};

inline const char* ToString(EventKind kind) {
    switch (kind) {
        case EventKind::kMention: return "mention";
        case EventKind::kSlashCommand: return "slash-command";
        case EventKind::kThreadReply: return "thread-reply";
    }
    return "unknown";
}

// One delivery of a user trigger. Redelivery reuses event_id.
struct InboundEvent {
    std::string event_id;
    std::string author_id;
    std::string author_name;
    std::string channel_id;
    std::optional<std::string> guild_id;
    bool in_thread = false;
    bool has_attachments = false;
    EventKind kind = EventKind::kMention;
    std::string content;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::string MessageKey() const {
        return event_id + ":" + channel_id;
    }

    std::string CommandKey() const {
        return event_id + ":" + author_id;
    }
};

struct Attachment {
    std::string filename;
    std::string data;
};

struct ResponsePayload {
    std::string text;
    std::vector<Attachment> visualizations;
};

}  // namespace tfbot::bus
