#include "platform/platform.hpp"

#include <initializer_list>
#include <string_view>

#include "utils/common.hpp"

namespace tfbot::platform {
namespace {

bool ContainsAny(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    for (const auto needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kTransientTransport: return "transient-transport";
        case ErrorKind::kAlreadyExists: return "already-exists";
        case ErrorKind::kPermissionDenied: return "permission-denied";
        case ErrorKind::kPayloadTooLarge: return "payload-too-large";
        case ErrorKind::kNotFound: return "not-found";
        case ErrorKind::kOther: return "other";
    }
    return "unknown";
}

PlatformError::PlatformError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {}

ErrorKind ClassifyError(const std::string& text) {
    const auto lowered = utils::ToLower(utils::Trim(text));
    // An empty body means the request never got a response from the service.
    if (lowered.empty()) {
        return ErrorKind::kTransientTransport;
    }
    if (ContainsAny(lowered, {"already been created", "already has a thread", "160004"})) {
        return ErrorKind::kAlreadyExists;
    }
    if (ContainsAny(lowered, {"missing permissions", "missing access", "50013", "50001", "forbidden"})) {
        return ErrorKind::kPermissionDenied;
    }
    if (ContainsAny(lowered, {"request entity too large", "40005", "too large"})) {
        return ErrorKind::kPayloadTooLarge;
    }
    if (ContainsAny(lowered, {"unknown channel", "unknown message", "not found", "10003", "10008"})) {
        return ErrorKind::kNotFound;
    }
    if (ContainsAny(lowered, {"ssl", "handshake", "connection reset", "connection refused",
                              "timed out", "timeout", "broken pipe", "eof"})) {
        return ErrorKind::kTransientTransport;
    }
    return ErrorKind::kOther;
}

}  // namespace tfbot::platform
