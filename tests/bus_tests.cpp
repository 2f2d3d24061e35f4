#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "bus/message_bus.hpp"
#include "channels/channel_base.hpp"
#include "test_support.hpp"

using tfbot::testing::MakeEvent;
using tfbot::testing::expect;
using tfbot::testing::run_test;

namespace {

using namespace std::chrono_literals;

class TestChannel : public tfbot::channels::ChannelBase {
public:
    TestChannel(tfbot::bus::MessageBus& bus, std::vector<std::string> allow_from)
        : ChannelBase("test", bus, std::move(allow_from)) {}

    void Start() override { running_ = true; }
    void Stop() override { running_ = false; }
};

void test_bus_preserves_order() {
    tfbot::bus::MessageBus bus;
    bus.PublishInbound(MakeEvent("E1"));
    bus.PublishInbound(MakeEvent("E2"));
    expect(bus.InboundSize() == 2, "two queued");

    tfbot::bus::InboundEvent event;
    expect(bus.TryConsumeInbound(event, 10ms) && event.event_id == "E1", "first in first out");
    expect(bus.TryConsumeInbound(event, 10ms) && event.event_id == "E2", "second follows");
    expect(!bus.TryConsumeInbound(event, 10ms), "empty bus times out");
}

void test_bus_wakes_consumer() {
    tfbot::bus::MessageBus bus;
    std::thread producer([&bus]() {
        std::this_thread::sleep_for(20ms);
        bus.PublishInbound(MakeEvent("E1"));
    });
    tfbot::bus::InboundEvent event;
    const bool got = bus.TryConsumeInbound(event, 2000ms);
    producer.join();
    expect(got && event.event_id == "E1", "consumer woken by publish");
}

void test_stopped_bus_drains_then_ends() {
    tfbot::bus::MessageBus bus;
    bus.PublishInbound(MakeEvent("E1"));
    bus.Stop();
    expect(bus.IsStopped(), "stopped");
    tfbot::bus::InboundEvent event;
    expect(bus.TryConsumeInbound(event, 10ms), "queued event still delivered");
    expect(!bus.TryConsumeInbound(event, 1000ms), "stopped empty bus returns at once");
}

void test_event_keys() {
    const auto event = MakeEvent("E1");
    expect(event.MessageKey() == "E1:channel-1", "message key scoped by channel");
    expect(event.CommandKey() == "E1:user-1", "command key scoped by author");
}

void test_allow_list() {
    tfbot::bus::MessageBus bus;
    TestChannel open(bus, {});
    expect(open.IsAllowed("anyone"), "empty list allows everyone");

    TestChannel closed(bus, {"user-1", "carol"});
    expect(closed.IsAllowed("user-1"), "listed id");
    expect(closed.IsAllowed("user-9|carol"), "listed username");
    expect(!closed.IsAllowed("user-9|dave"), "unlisted sender");

    expect(closed.HandleEvent(MakeEvent("E1"), "user-1|alice"), "allowed event published");
    expect(!closed.HandleEvent(MakeEvent("E2"), "user-9|dave"), "blocked event dropped");
    expect(bus.InboundSize() == 1, "only the allowed event queued");

    closed.Start();
    expect(closed.IsRunning() && closed.Name() == "test", "channel state");
}

}  // namespace

int main() {
    run_test("bus_preserves_order", test_bus_preserves_order);
    run_test("bus_wakes_consumer", test_bus_wakes_consumer);
    run_test("stopped_bus_drains_then_ends", test_stopped_bus_drains_then_ends);
    run_test("event_keys", test_event_keys);
    run_test("allow_list", test_allow_list);
    return tfbot::testing::finish("bus_tests");
}
