#include "delivery/response_delivery.hpp"

#include <algorithm>
#include <utility>

#include "delivery/message_splitter.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tfbot::delivery {
namespace {

constexpr const char* kTag = "delivery";

// Room kept for the "[Part i/N]\n" prefix.
constexpr std::size_t kHeaderReserve = 32;

}  // namespace

DeliveryError::DeliveryError(const std::string& message,
                             std::size_t delivered_chunks,
                             std::optional<platform::MessageHandle> first_handle)
    : std::runtime_error(message)
    , delivered_chunks_(delivered_chunks)
    , first_handle_(std::move(first_handle)) {}

ResponseDelivery::ResponseDelivery(platform::Platform& platform,
                                   DeliveryOptions options,
                                   utils::Clock& clock)
    : platform_(platform)
    , options_(std::move(options))
    , clock_(clock) {
    options_.max_attempts = std::max(options_.max_attempts, 1);
    if (options_.platform_limit > kHeaderReserve
        && options_.chunk_length + kHeaderReserve > options_.platform_limit) {
        options_.chunk_length = options_.platform_limit - kHeaderReserve;
    }
}

std::vector<std::string> ResponseDelivery::PrepareChunks(const std::string& text) const {
    return AddPartHeaders(SplitMessage(text, options_.chunk_length));
}

std::chrono::milliseconds ResponseDelivery::BackoffFor(int attempt) const {
    const auto shift = std::clamp(attempt - 1, 0, 16);
    return options_.backoff_base * (1LL << shift);
}

platform::MessageHandle ResponseDelivery::Deliver(const std::string& destination_id,
                                                  const bus::ResponsePayload& payload,
                                                  const FirstChunkCallback& on_first_chunk) {
    if (payload.text.empty() && payload.visualizations.empty()) {
        throw DeliveryError("nothing to deliver", 0, std::nullopt);
    }

    const auto chunks = PrepareChunks(payload.text);
    auto first = SendFirstChunk(destination_id, chunks.front(), payload.visualizations);
    if (on_first_chunk) {
        on_first_chunk(first);
    }

    for (std::size_t i = 1; i < chunks.size(); ++i) {
        try {
            platform_.SendMessage(destination_id, chunks[i], {});
        } catch (const platform::PlatformError& e) {
            utils::LogError(kTag, "chunk " + std::to_string(i + 1) + "/"
                + std::to_string(chunks.size()) + " to " + destination_id
                + " failed: " + e.what());
            throw DeliveryError(std::string("chunk delivery failed: ") + e.what(), i, first);
        }
    }

    if (chunks.size() > 1) {
        utils::LogDebug(kTag, "delivered " + std::to_string(chunks.size())
            + " chunks to " + destination_id);
    }
    return first;
}

platform::MessageHandle ResponseDelivery::SendFirstChunk(
    const std::string& destination_id,
    const std::string& chunk,
    const std::vector<bus::Attachment>& attachments) {
    std::string last_error;
    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        try {
            // Each attempt gets its own copy: a failed upload may consume the buffers.
            return platform_.SendMessage(destination_id, chunk, attachments);
        } catch (const platform::PlatformError& e) {
            last_error = e.what();
            if (!e.IsTransient()) {
                utils::LogWarn(kTag, "first chunk to " + destination_id + " rejected ("
                    + platform::ToString(e.Kind()) + "): " + e.what());
                if (attachments.empty()) {
                    throw DeliveryError("delivery failed: " + last_error, 0, std::nullopt);
                }
                break;
            }
            utils::LogWarn(kTag, "transient failure sending to " + destination_id
                + " (attempt " + std::to_string(attempt) + "/"
                + std::to_string(options_.max_attempts) + "): " + e.what());
            if (attempt < options_.max_attempts || !attachments.empty()) {
                clock_.SleepFor(BackoffFor(attempt));
            }
        }
    }

    if (attachments.empty()) {
        throw DeliveryError("delivery failed after retries: " + last_error, 0, std::nullopt);
    }
    if (utils::Trim(chunk).empty()) {
        utils::LogError(kTag, "attachments to " + destination_id
            + " failed and there is no text to fall back to: " + last_error);
        throw DeliveryError("attachment delivery failed with no text to resend: " + last_error,
                            0, std::nullopt);
    }

    utils::LogWarn(kTag, "dropping " + std::to_string(attachments.size())
        + " attachment(s) for " + destination_id + " and resending as text");
    try {
        return platform_.SendMessage(destination_id, chunk, {});
    } catch (const platform::PlatformError& e) {
        utils::LogError(kTag, "text-only resend to " + destination_id + " failed: " + e.what());
        throw DeliveryError(std::string("text-only resend failed: ") + e.what(), 0, std::nullopt);
    }
}

}  // namespace tfbot::delivery
