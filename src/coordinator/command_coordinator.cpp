#include "coordinator/command_coordinator.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "coordinator/query.hpp"
#include "utils/logging.hpp"

namespace tfbot::coordinator {
namespace {

constexpr const char* kTag = "coordinator";

// Owns the transient "working" message. Deleted once, on whichever path
// gets there first.
class IndicatorGuard {
public:
    explicit IndicatorGuard(platform::Platform& platform)
        : platform_(platform) {}

    ~IndicatorGuard() { Release(); }

    IndicatorGuard(const IndicatorGuard&) = delete;
    IndicatorGuard& operator=(const IndicatorGuard&) = delete;

    void Show(const std::string& destination_id, const std::string& text) {
        try {
            handle_ = platform_.SendMessage(destination_id, text, {});
        } catch (const std::exception& e) {
            utils::LogWarn(kTag, "could not post working indicator to " + destination_id
                + ": " + e.what());
        }
    }

    void Release() {
        if (!handle_) {
            return;
        }
        auto handle = std::move(*handle_);
        handle_.reset();
        try {
            platform_.DeleteMessage(handle);
        } catch (const std::exception& e) {
            utils::LogWarn(kTag, "could not delete working indicator " + handle.id
                + ": " + e.what());
        }
    }

private:
    platform::Platform& platform_;
    std::optional<platform::MessageHandle> handle_;
};

}  // namespace

// Tracks the state of one event and enforces the transition graph.
class CommandCoordinator::Lifecycle {
public:
    Lifecycle(const std::string& event_id, LifecycleObserver observer)
        : observer_(std::move(observer)) {
        result_.event_id = event_id;
        Notify();
    }

    void MoveTo(LifecycleState next) {
        if (!IsValidTransition(result_.state, next)) {
            throw std::logic_error(std::string("invalid lifecycle transition ")
                + ToString(result_.state) + " -> " + ToString(next));
        }
        result_.state = next;
        Notify();
    }

    LifecycleResult& Result() { return result_; }

private:
    void Notify() {
        if (observer_) {
            observer_(result_.event_id, result_.state);
        }
    }

    LifecycleObserver observer_;
    LifecycleResult result_;
};

CommandCoordinator::CommandCoordinator(Dependencies deps,
                                       CoordinatorOptions options,
                                       boost::asio::thread_pool& pool)
    : deps_(deps)
    , options_(std::move(options))
    , pool_(pool) {}

void CommandCoordinator::SetObserver(LifecycleObserver observer) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    observer_ = std::move(observer);
}

LifecycleObserver CommandCoordinator::Observer() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return observer_;
}

void CommandCoordinator::SetBotUserId(const std::string& bot_user_id) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.bot_user_id = bot_user_id;
}

std::string CommandCoordinator::BotUserId() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_.bot_user_id;
}

void CommandCoordinator::Submit(const bus::InboundEvent& event) {
    boost::asio::post(pool_, [this, event]() {
        try {
            const auto result = Handle(event);
            if (!IsTerminal(result.state)) {
                utils::LogError(kTag, "event " + result.event_id + " stopped in non-terminal state "
                    + ToString(result.state));
                return;
            }
            utils::LogDebug(kTag, "event " + result.event_id + " finished in "
                + ToString(result.state));
        } catch (const std::exception& e) {
            utils::LogError(kTag, "lifecycle for event " + event.event_id
                + " aborted: " + e.what());
        }
    });
}

LifecycleResult CommandCoordinator::Handle(const bus::InboundEvent& event) {
    Lifecycle lifecycle(event.event_id, Observer());
    auto& result = lifecycle.Result();

    // Both keys are registered; a redelivery may repeat either one.
    const bool message_new = deps_.message_dedup.CheckAndRegister(event.MessageKey());
    const bool command_new = deps_.command_dedup.CheckAndRegister(event.CommandKey());
    if (!message_new || !command_new) {
        utils::LogInfo(kTag, "duplicate event " + event.event_id + " in channel "
            + event.channel_id + " ignored");
        lifecycle.MoveTo(LifecycleState::kDedupRejected);
        return result;
    }
    lifecycle.MoveTo(LifecycleState::kDedupAccepted);

    const auto query = ExtractEventQuery(event, BotUserId());
    if (!Admit(event, query, lifecycle)) {
        return result;
    }

    lifecycle.MoveTo(LifecycleState::kThreadResolving);
    result.thread = ResolveThread(event);
    lifecycle.MoveTo(LifecycleState::kThreadReady);
    const auto destination = result.thread ? result.thread->id : event.channel_id;

    IndicatorGuard indicator(deps_.platform);
    indicator.Show(destination, options_.messages.processing);
    lifecycle.MoveTo(LifecycleState::kProcessing);

    bus::ResponsePayload payload;
    try {
        payload = deps_.collaborator.Process(event, query);
    } catch (const std::exception& e) {
        utils::LogError(kTag, "processing failed for event " + event.event_id
            + " (" + bus::ToString(event.kind) + ") from " + event.author_id
            + " in " + event.channel_id + ": " + e.what());
        result.error = e.what();
        indicator.Release();
        SendNotice(destination, options_.messages.processing_error);
        lifecycle.MoveTo(LifecycleState::kFailed);
        return result;
    }

    lifecycle.MoveTo(LifecycleState::kDelivering);
    try {
        result.first_handle = deps_.delivery.Deliver(
            destination, payload, [&indicator](const platform::MessageHandle&) {
                indicator.Release();
            });
    } catch (const delivery::DeliveryError& e) {
        utils::LogError(kTag, "delivery failed for event " + event.event_id
            + " to " + destination + " after " + std::to_string(e.DeliveredChunks())
            + " chunk(s): " + e.what());
        result.error = e.what();
        result.first_handle = e.FirstHandle();
        indicator.Release();
        SendNotice(destination, options_.messages.processing_error);
        lifecycle.MoveTo(LifecycleState::kFailed);
        return result;
    } catch (const std::exception& e) {
        utils::LogError(kTag, "delivery aborted for event " + event.event_id
            + " to " + destination + ": " + e.what());
        result.error = e.what();
        indicator.Release();
        SendNotice(destination, options_.messages.processing_error);
        lifecycle.MoveTo(LifecycleState::kFailed);
        return result;
    }

    lifecycle.MoveTo(LifecycleState::kDelivered);
    utils::LogInfo(kTag, "delivered response for event " + event.event_id + " to " + destination);
    Record(event, query, payload.text, destination);
    return result;
}

bool CommandCoordinator::Admit(const bus::InboundEvent& event,
                               const std::string& query,
                               Lifecycle& lifecycle) {
    if (query.empty()) {
        utils::LogInfo(kTag, "event " + event.event_id + " has no query");
        SendNotice(event.channel_id, options_.messages.no_query);
        lifecycle.MoveTo(LifecycleState::kRejected);
        return false;
    }

    if (deps_.rate_limiter) {
        const auto decision = deps_.rate_limiter->Check(event.author_id);
        if (decision.limited) {
            utils::LogInfo(kTag, "rate limited " + event.author_id + " (" + decision.reason
                + "), retry in " + std::to_string(decision.retry_after_s) + "s");
            const auto& templ = decision.reason == "cooldown"
                ? options_.messages.rate_limit_cooldown
                : options_.messages.rate_limit_exceeded;
            SendNotice(event.channel_id, FormatWait(templ, decision.retry_after_s));
            lifecycle.Result().error = decision.reason;
            lifecycle.MoveTo(LifecycleState::kRejected);
            return false;
        }
    }
    return true;
}

// The resolver already degrades on platform errors. Anything else it lets
// through also falls back to the original channel.
std::optional<platform::Thread> CommandCoordinator::ResolveThread(const bus::InboundEvent& event) {
    try {
        return deps_.resolver.Resolve(event);
    } catch (const std::exception& e) {
        utils::LogWarn(kTag, "thread resolution failed for event " + event.event_id
            + ", replying in " + event.channel_id + ": " + e.what());
        return std::nullopt;
    }
}

void CommandCoordinator::SendNotice(const std::string& destination_id, const std::string& text) {
    try {
        deps_.platform.SendMessage(destination_id, text, {});
    } catch (const std::exception& e) {
        utils::LogWarn(kTag, "could not send notice to " + destination_id + ": " + e.what());
    }
}

void CommandCoordinator::Record(const bus::InboundEvent& event,
                                const std::string& query,
                                const std::string& response,
                                const std::string& destination_id) {
    if (!deps_.store) {
        return;
    }
    try {
        deps_.store->RecordExchange(event, query, response, destination_id);
    } catch (const std::exception& e) {
        utils::LogWarn(kTag, "could not record exchange for event " + event.event_id
            + ": " + e.what());
    }
}

}  // namespace tfbot::coordinator
