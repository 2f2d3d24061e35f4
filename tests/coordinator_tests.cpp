#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "cache/dedup_cache.hpp"
#include "cache/thread_resolution_cache.hpp"
#include "collaborators/llm_collaborator.hpp"
#include "coordinator/command_coordinator.hpp"
#include "coordinator/lifecycle.hpp"
#include "coordinator/query.hpp"
#include "delivery/response_delivery.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "test_support.hpp"
#include "threads/thread_resolver.hpp"

using tfbot::coordinator::CommandCoordinator;
using tfbot::coordinator::LifecycleState;
using tfbot::platform::ErrorKind;
using tfbot::testing::FakeCollaborator;
using tfbot::testing::FakeMessageStore;
using tfbot::testing::FakePlatform;
using tfbot::testing::MakeEvent;
using tfbot::testing::ManualClock;
using tfbot::testing::ScriptedProvider;
using tfbot::testing::expect;
using tfbot::testing::run_test;

namespace {

using namespace std::chrono_literals;

// Collects every state each event passes through.
class StateLog {
public:
    void Add(const std::string& event_id, LifecycleState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        states_[event_id].push_back(state);
    }

    std::vector<LifecycleState> For(const std::string& event_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(event_id);
        return it == states_.end() ? std::vector<LifecycleState>{} : it->second;
    }

    int Count(const std::string& event_id, LifecycleState state) const {
        int count = 0;
        for (const auto s : For(event_id)) {
            if (s == state) {
                count++;
            }
        }
        return count;
    }

private:
    std::map<std::string, std::vector<LifecycleState>> states_;
    mutable std::mutex mutex_;
};

// With `with_llm` the coordinator talks to an LlmCollaborator that reads
// thread history from `store`; otherwise to the scripted collaborator.
struct Fixture {
    explicit Fixture(bool with_llm = false)
        : coordinator(Deps(with_llm),
                      tfbot::coordinator::CoordinatorOptions{.bot_user_id = "bot", .messages = messages},
                      pool) {
        coordinator.SetObserver([this](const std::string& event_id, LifecycleState state) {
            log.Add(event_id, state);
        });
    }

    ManualClock clock;
    FakePlatform platform{&clock};
    tfbot::cache::DedupCache message_dedup{1000};
    tfbot::cache::DedupCache command_dedup{500};
    tfbot::cache::ThreadResolutionCache thread_cache{500};
    tfbot::threads::ThreadResolver resolver{
        platform, thread_cache, tfbot::threads::ThreadResolverOptions{}, clock};
    tfbot::delivery::ResponseDelivery delivery{platform, tfbot::delivery::DeliveryOptions{}, clock};
    FakeCollaborator collaborator;
    FakeMessageStore store;
    ScriptedProvider provider;
    tfbot::collaborators::LlmCollaborator llm{
        provider,
        tfbot::collaborators::LlmCollaboratorOptions{.model = "test-model", .system_prompt = "Be brief."},
        &store};
    tfbot::ratelimit::RateLimiter limiter{tfbot::ratelimit::RateLimitConfig{}, clock};
    tfbot::config::MessagesConfig messages;
    StateLog log;
    boost::asio::thread_pool pool{2};
    CommandCoordinator coordinator;

    CommandCoordinator::Dependencies Deps(bool with_llm) {
        tfbot::collaborators::Collaborator& chosen = with_llm
            ? static_cast<tfbot::collaborators::Collaborator&>(llm)
            : static_cast<tfbot::collaborators::Collaborator&>(collaborator);
        return CommandCoordinator::Dependencies{
            .platform = platform,
            .message_dedup = message_dedup,
            .command_dedup = command_dedup,
            .resolver = resolver,
            .delivery = delivery,
            .collaborator = chosen,
            .store = &store,
            .rate_limiter = &limiter};
    }
};

void test_concurrent_duplicates_process_once() {
    Fixture f;
    constexpr int kCallers = 16;
    std::atomic<bool> go{false};
    std::atomic<int> delivered{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&f, &go, &delivered, &rejected]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            const auto result = f.coordinator.Handle(MakeEvent("E1"));
            if (result.state == LifecycleState::kDelivered) {
                delivered++;
            } else if (result.state == LifecycleState::kDedupRejected) {
                rejected++;
            }
        });
    }
    go = true;
    for (auto& caller : callers) {
        caller.join();
    }

    expect(delivered.load() == 1, "exactly one lifecycle delivered");
    expect(rejected.load() == kCallers - 1, "all others rejected as duplicates");
    expect(f.log.Count("E1", LifecycleState::kProcessing) == 1, "one PROCESSING for the event");
    expect(f.collaborator.Calls() == 1, "collaborator invoked once");
    expect(f.platform.BotCreatedThreads() == 1, "one thread created");
    expect(f.store.Records().size() == 1, "one exchange recorded");
}

void test_delivered_then_redelivery_rejected() {
    Fixture f;
    const std::string answer(500, 'r');
    f.collaborator.SetResponse({answer, {}});
    const auto result = f.coordinator.Handle(MakeEvent("E1"));
    expect(result.state == LifecycleState::kDelivered, "first delivery succeeds");
    expect(result.thread.has_value(), "reply went to a thread");
    expect(result.first_handle.has_value(), "first handle reported");
    expect(f.collaborator.Queries().size() == 1 && f.collaborator.Queries()[0] == "hello there",
           "mention stripped from the query");

    const auto thread_id = result.thread->id;
    const auto in_thread = f.platform.SentTo(thread_id);
    expect(in_thread.size() == 2, "indicator and response posted in the thread");
    expect(in_thread[0].content == f.messages.processing, "indicator posted first");
    expect(in_thread[1].content == answer, "whole response posted as one message");
    expect(f.platform.Deleted().size() == 1 && f.platform.Deleted()[0].id == in_thread[0].id,
           "indicator removed");

    const auto records = f.store.Records();
    expect(records.size() == 1, "exchange recorded");
    expect(records[0].query == "hello there" && records[0].destination_id == thread_id,
           "record carries query and destination");

    f.clock.Advance(50ms);
    const auto again = f.coordinator.Handle(MakeEvent("E1"));
    expect(again.state == LifecycleState::kDedupRejected, "redelivery rejected");
    expect(f.platform.CreateCalls() == 1, "no second thread attempt");
    expect(f.platform.Sent().size() == 2, "no second message");
    expect(f.collaborator.Calls() == 1, "no second processing");
}

void test_redelivery_in_other_channel_rejected_by_command_key() {
    Fixture f;
    f.coordinator.Handle(MakeEvent("E1"));
    auto moved = MakeEvent("E1");
    moved.channel_id = "channel-2";
    const auto result = f.coordinator.Handle(moved);
    expect(result.state == LifecycleState::kDedupRejected, "same author and event is a duplicate");
    expect(f.collaborator.Calls() == 1, "processed once");
}

void test_lifecycle_states_in_order() {
    Fixture f;
    f.coordinator.Handle(MakeEvent("E1"));
    const std::vector<LifecycleState> expected{
        LifecycleState::kArrived,
        LifecycleState::kDedupAccepted,
        LifecycleState::kThreadResolving,
        LifecycleState::kThreadReady,
        LifecycleState::kProcessing,
        LifecycleState::kDelivering,
        LifecycleState::kDelivered};
    expect(f.log.For("E1") == expected, "happy path visits every state in order");
}

void test_collaborator_failure_notifies_and_fails() {
    Fixture f;
    f.collaborator.SetError("model unavailable");
    const auto result = f.coordinator.Handle(MakeEvent("E1"));
    expect(result.state == LifecycleState::kFailed, "processing failure is terminal");
    expect(result.error == "model unavailable", "error reported");

    const auto in_thread = f.platform.SentTo(result.thread->id);
    expect(in_thread.size() == 2, "indicator and error notice");
    expect(in_thread[1].content == f.messages.processing_error, "generic error notice sent");
    expect(f.platform.Deleted().size() == 1, "indicator removed");
    expect(f.store.Records().empty(), "nothing recorded");
    expect(f.log.Count("E1", LifecycleState::kDelivering) == 0, "never reached DELIVERING");
}

void test_delivery_failure_notifies_and_fails() {
    Fixture f;
    // The indicator and the response are both refused.
    f.platform.FailNextSends(ErrorKind::kPermissionDenied, 2);
    const auto result = f.coordinator.Handle(MakeEvent("E1"));
    expect(result.state == LifecycleState::kFailed, "delivery failure is terminal");
    expect(!result.error.empty(), "error reported");
    const auto sent = f.platform.Sent();
    expect(sent.size() == 1 && sent[0].content == f.messages.processing_error, "error notice sent");
    expect(f.store.Records().empty(), "nothing recorded");
}

void test_empty_query_rejected() {
    Fixture f;
    const auto result = f.coordinator.Handle(MakeEvent("E1", "<@bot>   "));
    expect(result.state == LifecycleState::kRejected, "empty query rejected");
    const auto sent = f.platform.SentTo("channel-1");
    expect(sent.size() == 1 && sent[0].content == f.messages.no_query, "usage hint in channel");
    expect(f.platform.CreateCalls() == 0, "no thread for a rejected event");
    expect(f.collaborator.Calls() == 0, "collaborator not invoked");
}

void test_rate_limited_user_rejected() {
    Fixture f;
    expect(f.coordinator.Handle(MakeEvent("E1")).state == LifecycleState::kDelivered, "first allowed");

    const auto limited = f.coordinator.Handle(MakeEvent("E2"));
    expect(limited.state == LifecycleState::kRejected, "second request inside cooldown rejected");
    expect(limited.error == "cooldown", "cooldown reason");
    const auto notices = f.platform.SentTo("channel-1");
    expect(notices.size() == 1, "notice in originating channel");
    expect(notices[0].content == "Please wait 10 seconds before making another request.",
           "wait time filled in");

    f.clock.Advance(10s);
    expect(f.coordinator.Handle(MakeEvent("E3")).state == LifecycleState::kDelivered,
           "allowed after cooldown");
    expect(f.collaborator.Calls() == 2, "rejected event never processed");
}

void test_store_failure_does_not_fail_delivery() {
    Fixture f;
    f.store.SetFail(true);
    const auto result = f.coordinator.Handle(MakeEvent("E1"));
    expect(result.state == LifecycleState::kDelivered, "delivery stands when recording fails");
}

void test_thread_reply_stays_in_thread() {
    Fixture f;
    auto event = MakeEvent("E1");
    event.kind = tfbot::bus::EventKind::kThreadReply;
    event.in_thread = true;
    event.channel_id = "thread-9";
    const auto result = f.coordinator.Handle(event);
    expect(result.state == LifecycleState::kDelivered, "delivered");
    expect(result.thread && result.thread->id == "thread-9", "existing thread used");
    expect(f.platform.CreateCalls() == 0, "no thread created");
    expect(f.platform.SentTo("thread-9").size() == 2, "indicator and reply in the thread");
}

void test_direct_message_replies_in_channel() {
    Fixture f;
    auto event = MakeEvent("E1");
    event.guild_id.reset();
    const auto result = f.coordinator.Handle(event);
    expect(result.state == LifecycleState::kDelivered, "delivered");
    expect(!result.thread.has_value(), "no thread outside a guild");
    expect(f.platform.SentTo("channel-1").size() == 2, "reply in the originating channel");
}

void test_slash_command_query() {
    Fixture f;
    auto event = MakeEvent("E1", "ask what is the weather");
    event.kind = tfbot::bus::EventKind::kSlashCommand;
    expect(f.coordinator.Handle(event).state == LifecycleState::kDelivered, "delivered");
    expect(f.collaborator.Queries()[0] == "what is the weather", "command name dropped");

    auto bare = MakeEvent("E2", "ask");
    bare.kind = tfbot::bus::EventKind::kSlashCommand;
    bare.author_id = "user-2";
    expect(f.coordinator.Handle(bare).state == LifecycleState::kRejected, "bare command rejected");
}

void test_submit_runs_on_pool() {
    Fixture f;
    f.coordinator.Submit(MakeEvent("E1"));
    auto other = MakeEvent("E2");
    other.author_id = "user-2";
    f.coordinator.Submit(other);
    f.pool.join();
    expect(f.log.Count("E1", LifecycleState::kDelivered) == 1, "first event delivered");
    expect(f.log.Count("E2", LifecycleState::kDelivered) == 1, "second event delivered");
}

void test_bot_user_id_update() {
    Fixture f;
    f.coordinator.SetBotUserId("42");
    expect(f.coordinator.BotUserId() == "42", "bot id updated");
    f.coordinator.Handle(MakeEvent("E1", "<@!42> ping"));
    expect(f.collaborator.Queries()[0] == "ping", "nickname mention stripped");
}

void test_thread_follow_up_sees_earlier_exchange() {
    Fixture f(true);
    f.provider.response.content = "Rust is a systems language.";
    const auto first = f.coordinator.Handle(MakeEvent("E1", "<@bot> what is rust"));
    expect(first.state == LifecycleState::kDelivered, "opening question answered");
    expect(first.thread.has_value(), "answered in a new thread");
    expect(f.provider.last_messages.size() == 2, "opening question has no history");

    f.clock.Advance(10s);
    auto follow_up = MakeEvent("E2", "<@bot> is it fast?");
    follow_up.kind = tfbot::bus::EventKind::kThreadReply;
    follow_up.in_thread = true;
    follow_up.channel_id = first.thread->id;
    f.provider.response.content = "Yes.";
    const auto second = f.coordinator.Handle(follow_up);
    expect(second.state == LifecycleState::kDelivered, "follow-up answered");
    expect(second.thread && second.thread->id == first.thread->id, "same thread");

    const auto& messages = f.provider.last_messages;
    expect(messages.size() == 4, "system, earlier exchange, follow-up");
    expect(messages[1].role == "user" && messages[1].content == "what is rust", "earlier question replayed");
    expect(messages[2].role == "assistant" && messages[2].content == "Rust is a systems language.",
           "earlier answer replayed");
    expect(messages[3].role == "user" && messages[3].content == "is it fast?", "follow-up last");
    expect(f.store.Records().size() == 2, "both exchanges recorded");
}

void test_unclassified_resolver_error_falls_back_to_channel() {
    Fixture f;
    f.platform.BreakCreate();
    const auto result = f.coordinator.Handle(MakeEvent("E1"));
    expect(result.state == LifecycleState::kDelivered, "still delivered");
    expect(!result.thread.has_value(), "no thread");
    expect(f.platform.SentTo("channel-1").size() == 2, "indicator and reply in the channel");
    expect(f.log.Count("E1", LifecycleState::kThreadReady) == 1, "resolution completed");
}

void test_unclassified_delivery_error_fails_with_notice() {
    Fixture f;
    // Send 1 is the indicator, send 2 the response.
    f.platform.BreakSendCall(2);
    const auto result = f.coordinator.Handle(MakeEvent("E1"));
    expect(result.state == LifecycleState::kFailed, "lifecycle reaches FAILED");
    expect(result.error == "scripted unclassified send failure", "error reported");
    expect(f.log.Count("E1", LifecycleState::kFailed) == 1, "terminal state reached once");

    const auto in_thread = f.platform.SentTo(result.thread->id);
    expect(in_thread.size() == 2, "indicator and error notice");
    expect(in_thread[1].content == f.messages.processing_error, "user notified");
    expect(f.platform.Deleted().size() == 1, "indicator removed");
    expect(f.store.Records().empty(), "nothing recorded");
}

void test_observer_swap_leaves_running_lifecycle_alone() {
    Fixture f;
    StateLog later;
    f.collaborator.SetDelay(100ms);
    std::thread worker([&f]() { f.coordinator.Handle(MakeEvent("E1")); });
    while (f.log.Count("E1", LifecycleState::kProcessing) == 0) {
        std::this_thread::yield();
    }
    f.coordinator.SetObserver([&later](const std::string& event_id, LifecycleState state) {
        later.Add(event_id, state);
    });
    worker.join();

    expect(f.log.Count("E1", LifecycleState::kDelivered) == 1, "original observer saw the end");
    expect(later.For("E1").empty(), "new observer not attached mid-lifecycle");

    auto next = MakeEvent("E2");
    next.author_id = "user-2";
    f.coordinator.Handle(next);
    expect(later.Count("E2", LifecycleState::kDelivered) == 1, "new observer sees new lifecycles");
    expect(f.log.For("E2").empty(), "old observer detached");
}

void test_transition_graph() {
    using tfbot::coordinator::IsTerminal;
    using tfbot::coordinator::IsValidTransition;
    expect(IsValidTransition(LifecycleState::kArrived, LifecycleState::kDedupAccepted), "accept");
    expect(IsValidTransition(LifecycleState::kProcessing, LifecycleState::kFailed), "processing fails");
    expect(!IsValidTransition(LifecycleState::kDedupRejected, LifecycleState::kProcessing),
           "rejected event never processes");
    expect(!IsValidTransition(LifecycleState::kArrived, LifecycleState::kProcessing), "no skipping");
    expect(!IsValidTransition(LifecycleState::kDelivered, LifecycleState::kDelivering), "no reopening");
    expect(IsTerminal(LifecycleState::kDelivered) && IsTerminal(LifecycleState::kRejected), "terminal");
    expect(!IsTerminal(LifecycleState::kThreadReady), "not terminal");
    expect(std::string(tfbot::coordinator::ToString(LifecycleState::kDedupRejected)) == "DEDUP_REJECTED",
           "state name");
}

void test_query_helpers() {
    using tfbot::coordinator::ExtractQuery;
    using tfbot::coordinator::FormatWait;
    expect(ExtractQuery("<@!bot> hi <@bot>", "bot") == "hi", "both mention forms removed");
    expect(ExtractQuery("<@other> hi", "bot") == "<@other> hi", "other mentions kept");
    expect(ExtractQuery("  spaced  ", "") == "spaced", "trimmed without bot id");
    expect(FormatWait("wait {seconds}s ({seconds})", 7) == "wait 7s (7)", "placeholders replaced");
}

}  // namespace

int main() {
    run_test("concurrent_duplicates_process_once", test_concurrent_duplicates_process_once);
    run_test("delivered_then_redelivery_rejected", test_delivered_then_redelivery_rejected);
    run_test("redelivery_in_other_channel_rejected_by_command_key",
             test_redelivery_in_other_channel_rejected_by_command_key);
    run_test("lifecycle_states_in_order", test_lifecycle_states_in_order);
    run_test("collaborator_failure_notifies_and_fails", test_collaborator_failure_notifies_and_fails);
    run_test("delivery_failure_notifies_and_fails", test_delivery_failure_notifies_and_fails);
    run_test("empty_query_rejected", test_empty_query_rejected);
    run_test("rate_limited_user_rejected", test_rate_limited_user_rejected);
    run_test("store_failure_does_not_fail_delivery", test_store_failure_does_not_fail_delivery);
    run_test("thread_reply_stays_in_thread", test_thread_reply_stays_in_thread);
    run_test("direct_message_replies_in_channel", test_direct_message_replies_in_channel);
    run_test("slash_command_query", test_slash_command_query);
    run_test("submit_runs_on_pool", test_submit_runs_on_pool);
    run_test("bot_user_id_update", test_bot_user_id_update);
    run_test("thread_follow_up_sees_earlier_exchange", test_thread_follow_up_sees_earlier_exchange);
    run_test("unclassified_resolver_error_falls_back_to_channel",
             test_unclassified_resolver_error_falls_back_to_channel);
    run_test("unclassified_delivery_error_fails_with_notice",
             test_unclassified_delivery_error_fails_with_notice);
    run_test("observer_swap_leaves_running_lifecycle_alone", test_observer_swap_leaves_running_lifecycle_alone);
    run_test("transition_graph", test_transition_graph);
    run_test("query_helpers", test_query_helpers);
    return tfbot::testing::finish("coordinator_tests");
}
