#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/events.hpp"

namespace tfbot::store {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExchangeRecord {
    std::int64_t id = 0;
    std::string event_id;
    std::string author_id;
    std::string author_name;
    std::string channel_id;
    std::optional<std::string> guild_id;
    std::string destination_id;
    std::string query;
    std::string response;
    std::string created_at;
};

// Audit trail of answered requests. Also serves as conversation memory for
// follow-ups in a thread.
class MessageStore {
public:
    virtual ~MessageStore() = default;
    virtual void RecordExchange(const bus::InboundEvent& event,
                                const std::string& query,
                                const std::string& response,
                                const std::string& destination_id) = 0;

    // Exchanges answered in `destination_id` or asked from inside it, newest first.
    virtual std::vector<ExchangeRecord> RecentExchangesForDestination(const std::string& destination_id,
                                                                      std::size_t limit) const = 0;
};

}  // namespace tfbot::store
