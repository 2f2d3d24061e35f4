#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "platform/platform.hpp"
#include "utils/clock.hpp"

namespace tfbot::delivery {

struct DeliveryOptions {
    std::size_t platform_limit = 2000;
    std::size_t chunk_length = 1900;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
};

// Terminal delivery failure. Chunks sent before the failure stay delivered.
class DeliveryError : public std::runtime_error {
public:
    DeliveryError(const std::string& message,
                  std::size_t delivered_chunks,
                  std::optional<platform::MessageHandle> first_handle);

    std::size_t DeliveredChunks() const { return delivered_chunks_; }
    const std::optional<platform::MessageHandle>& FirstHandle() const { return first_handle_; }

private:
    std::size_t delivered_chunks_;
    std::optional<platform::MessageHandle> first_handle_;
};

// Sends a payload to one destination. The first chunk carries the
// attachments and is retried on transient transport errors; when that keeps
// failing it is resent as text only. Later chunks are sent once.
class ResponseDelivery {
public:
    using FirstChunkCallback = std::function<void(const platform::MessageHandle&)>;

    ResponseDelivery(platform::Platform& platform, DeliveryOptions options, utils::Clock& clock);

    // Returns the handle of the first delivered chunk. on_first_chunk runs as
    // soon as that chunk is confirmed.
    platform::MessageHandle Deliver(const std::string& destination_id,
                                    const bus::ResponsePayload& payload,
                                    const FirstChunkCallback& on_first_chunk = {});

    std::vector<std::string> PrepareChunks(const std::string& text) const;

    std::chrono::milliseconds BackoffFor(int attempt) const;

    const DeliveryOptions& Options() const { return options_; }

private:
    platform::MessageHandle SendFirstChunk(const std::string& destination_id,
                                           const std::string& chunk,
                                           const std::vector<bus::Attachment>& attachments);

    platform::Platform& platform_;
    DeliveryOptions options_;
    utils::Clock& clock_;
};

}  // namespace tfbot::delivery
