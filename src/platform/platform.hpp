#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/events.hpp"

namespace tfbot::platform {

enum class ErrorKind {
    kTransientTransport,
    kAlreadyExists,
    kPermissionDenied,
    kPayloadTooLarge,
    kNotFound,
    kOther
};

const char* ToString(ErrorKind kind);

class PlatformError : public std::runtime_error {
public:
    PlatformError(ErrorKind kind, const std::string& message);

    ErrorKind Kind() const { return kind_; }
    bool IsTransient() const { return kind_ == ErrorKind::kTransientTransport; }

private:
    ErrorKind kind_;
};

// Maps raw error text reported by the chat service onto an ErrorKind.
ErrorKind ClassifyError(const std::string& text);

struct Thread {
    std::string id;
    std::string parent_channel_id;
    std::string name;
};

struct MessageHandle {
    std::string id;
    std::string channel_id;
};

class Platform {
public:
    virtual ~Platform() = default;

    // Attachments are taken by value: the transport may consume the buffers.
    virtual MessageHandle SendMessage(const std::string& destination_id,
                                      const std::string& content,
                                      std::vector<bus::Attachment> attachments) = 0;
    virtual Thread CreateThread(const bus::InboundEvent& event, const std::string& name) = 0;
    virtual std::optional<Thread> FetchExistingThread(const bus::InboundEvent& event) = 0;
    virtual void DeleteMessage(const MessageHandle& handle) = 0;
};

}  // namespace tfbot::platform
