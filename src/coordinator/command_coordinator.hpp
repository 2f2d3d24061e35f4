#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "bus/events.hpp"
#include "cache/dedup_cache.hpp"
#include "collaborators/collaborator.hpp"
#include "config/config_schema.hpp"
#include "coordinator/lifecycle.hpp"
#include "delivery/response_delivery.hpp"
#include "platform/platform.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "store/message_store.hpp"
#include "threads/thread_resolver.hpp"

namespace tfbot::coordinator {

struct CoordinatorOptions {
    std::string bot_user_id;
    config::MessagesConfig messages;
};

using LifecycleObserver = std::function<void(const std::string& event_id, LifecycleState state)>;

// Runs each inbound event through dedup, admission, thread resolution,
// processing and delivery. At most one lifecycle per event identity gets
// past the dedup gate.
class CommandCoordinator {
public:
    struct Dependencies {
        platform::Platform& platform;
        cache::DedupCache& message_dedup;
        cache::DedupCache& command_dedup;
        threads::ThreadResolver& resolver;
        delivery::ResponseDelivery& delivery;
        collaborators::Collaborator& collaborator;
        store::MessageStore* store = nullptr;
        ratelimit::RateLimiter* rate_limiter = nullptr;
    };

    CommandCoordinator(Dependencies deps,
                       CoordinatorOptions options,
                       boost::asio::thread_pool& pool);

    // Runs one lifecycle on the calling thread.
    LifecycleResult Handle(const bus::InboundEvent& event);

    // Queues Handle on the worker pool and returns immediately.
    void Submit(const bus::InboundEvent& event);

    // Lifecycles already running keep the observer they started with.
    void SetObserver(LifecycleObserver observer);
    void SetBotUserId(const std::string& bot_user_id);
    std::string BotUserId() const;

private:
    class Lifecycle;

    bool Admit(const bus::InboundEvent& event, const std::string& query, Lifecycle& lifecycle);
    LifecycleObserver Observer() const;
    std::optional<platform::Thread> ResolveThread(const bus::InboundEvent& event);
    void SendNotice(const std::string& destination_id, const std::string& text);
    void Record(const bus::InboundEvent& event,
                const std::string& query,
                const std::string& response,
                const std::string& destination_id);

    Dependencies deps_;
    CoordinatorOptions options_;
    boost::asio::thread_pool& pool_;
    LifecycleObserver observer_;
    mutable std::mutex options_mutex_;
};

}  // namespace tfbot::coordinator
