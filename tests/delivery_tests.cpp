#include <chrono>
#include <string>
#include <vector>

#include "delivery/message_splitter.hpp"
#include "delivery/response_delivery.hpp"
#include "test_support.hpp"

using tfbot::platform::ErrorKind;
using tfbot::testing::FakePlatform;
using tfbot::testing::ManualClock;
using tfbot::testing::expect;
using tfbot::testing::run_test;

namespace {

using namespace std::chrono_literals;

std::string Join(const std::vector<std::string>& chunks) {
    std::string joined;
    for (const auto& chunk : chunks) {
        joined += chunk;
    }
    return joined;
}

std::string StripHeader(const std::string& chunk) {
    if (chunk.rfind("[Part ", 0) != 0) {
        return chunk;
    }
    return chunk.substr(chunk.find('\n') + 1);
}

tfbot::bus::ResponsePayload WithChart(std::string text) {
    tfbot::bus::ResponsePayload payload;
    payload.text = std::move(text);
    payload.visualizations.push_back({"chart.png", std::string(1024, '\x7f')});
    return payload;
}

void test_short_message_is_one_chunk() {
    const auto chunks = tfbot::delivery::SplitMessage("hello", 1900);
    expect(chunks.size() == 1 && chunks[0] == "hello", "short content untouched");
    expect(tfbot::delivery::AddPartHeaders(chunks)[0] == "hello", "single chunk has no header");
}

void test_three_limits_make_three_chunks() {
    const std::string content(3 * 1900, 'a');
    const auto chunks = tfbot::delivery::SplitMessage(content, 1900);
    expect(chunks.size() == 3, "exactly three chunks");
    for (const auto& chunk : chunks) {
        expect(chunk.size() <= 1900, "chunk within limit");
    }
    expect(Join(chunks) == content, "chunks concatenate to the original");
}

void test_prefers_paragraph_then_sentence_then_word() {
    const std::string paragraph = std::string(70, 'p') + "\n\n" + std::string(50, 'q');
    auto chunks = tfbot::delivery::SplitMessage(paragraph, 100);
    expect(chunks[0] == std::string(70, 'p') + "\n\n", "split after the paragraph break");

    const std::string sentence = std::string(30, 's') + ". " + std::string(90, 't');
    chunks = tfbot::delivery::SplitMessage(sentence, 100);
    expect(chunks[0] == std::string(30, 's') + ". ", "split after the sentence");

    std::string words;
    while (words.size() < 150) {
        words += "word ";
    }
    chunks = tfbot::delivery::SplitMessage(words, 100);
    expect(chunks[0].back() == ' ', "split after a space");
    expect(Join(chunks) == words, "word split is lossless");
}

void test_never_splits_utf8_sequence() {
    std::string content;
    for (int i = 0; i < 120; ++i) {
        content += "\xC3\xA9";
    }
    const auto chunks = tfbot::delivery::SplitMessage(content, 101);
    for (const auto& chunk : chunks) {
        expect(chunk.size() <= 101, "chunk within limit");
        expect((static_cast<unsigned char>(chunk.front()) & 0xC0) != 0x80, "chunk starts on a lead byte");
    }
    expect(Join(chunks) == content, "utf-8 split is lossless");
}

void test_code_block_kept_together() {
    const std::string block = "```\n" + std::string(60, 'c') + "\n```";
    const std::string content = std::string(50, 'x') + "\n" + block + "\n" + std::string(10, 'y');
    const auto chunks = tfbot::delivery::SplitMessage(content, 100);
    expect(chunks[0] == std::string(50, 'x') + "\n", "cut moved before the code block");
    expect(chunks[1].rfind("```", 0) == 0, "code block starts the next chunk");
    expect(Join(chunks) == content, "fence split is lossless");
}

void test_part_headers_numbered() {
    const auto headed = tfbot::delivery::AddPartHeaders({"a", "b", "c"});
    expect(headed[0] == "[Part 1/3]\na", "first header");
    expect(headed[2] == "[Part 3/3]\nc", "last header");
}

void test_long_response_delivered_in_order_with_attachment_on_first() {
    ManualClock clock;
    FakePlatform platform(&clock);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    const std::string text(3 * 1900, 'z');

    int first_chunk_callbacks = 0;
    const auto handle = delivery.Deliver("thread-1", WithChart(text), [&](const auto& first) {
        first_chunk_callbacks++;
        expect(first.id == "msg-1", "callback receives first handle");
    });

    const auto sent = platform.Sent();
    expect(sent.size() == 3, "three messages sent");
    expect(handle.id == sent[0].id, "handle of first chunk returned");
    expect(first_chunk_callbacks == 1, "first chunk callback fired once");
    expect(sent[0].attachment_count == 1, "attachment on first chunk");
    expect(sent[1].attachment_count == 0 && sent[2].attachment_count == 0, "no attachments later");
    std::string rebuilt;
    for (const auto& message : sent) {
        expect(message.content.size() <= 2000, "message within platform limit");
        rebuilt += StripHeader(message.content);
    }
    expect(rebuilt == text, "delivered chunks rebuild the response");
    expect(sent[0].content.rfind("[Part 1/3]\n", 0) == 0, "part header present");
}

void test_transient_failures_degrade_to_text_only() {
    ManualClock clock;
    FakePlatform platform(&clock);
    platform.FailNextSends(ErrorKind::kTransientTransport, 3);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);

    const auto handle = delivery.Deliver("thread-1", WithChart("chart attached"));
    const auto sent = platform.Sent();
    expect(sent.size() == 1, "one message delivered");
    expect(sent[0].attachment_count == 0, "delivered without attachments");
    expect(handle.id == sent[0].id, "handle of degraded message");

    const auto attempts = platform.SendAttempts();
    expect(attempts.size() == 4, "three attempts plus the text-only resend");
    for (int i = 0; i < 3; ++i) {
        expect(attempts[i].attachment_count == 1, "retries carry a fresh attachment copy");
    }
    const auto sleeps = clock.Sleeps();
    expect(sleeps.size() == 3, "three backoff sleeps");
    expect(sleeps[0] == 1000ms && sleeps[1] == 2000ms && sleeps[2] == 4000ms, "exponential backoff");
}

void test_transient_failure_recovers_on_retry() {
    ManualClock clock;
    FakePlatform platform(&clock);
    platform.FailNextSends(ErrorKind::kTransientTransport, 1);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    delivery.Deliver("thread-1", WithChart("chart attached"));
    const auto sent = platform.Sent();
    expect(sent.size() == 1 && sent[0].attachment_count == 1, "retry kept the attachment");
    expect(clock.Sleeps().size() == 1, "one backoff");
}

void test_permanent_failure_with_attachment_degrades_immediately() {
    ManualClock clock;
    FakePlatform platform(&clock);
    platform.FailSendsWithAttachments(ErrorKind::kPayloadTooLarge);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    delivery.Deliver("thread-1", WithChart("big chart"));
    expect(platform.SendCalls() == 2, "no retry for payload too large");
    expect(clock.Sleeps().empty(), "no backoff for permanent failure");
    expect(platform.Sent().size() == 1 && platform.Sent()[0].attachment_count == 0, "text-only delivered");
}

void test_permanent_text_failure_is_terminal() {
    ManualClock clock;
    FakePlatform platform(&clock);
    platform.FailNextSends(ErrorKind::kPermissionDenied, 1);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    bool thrown = false;
    try {
        tfbot::bus::ResponsePayload payload;
        payload.text = "hello";
        delivery.Deliver("thread-1", payload);
    } catch (const tfbot::delivery::DeliveryError& e) {
        thrown = true;
        expect(e.DeliveredChunks() == 0, "nothing delivered");
        expect(!e.FirstHandle().has_value(), "no first handle");
    }
    expect(thrown, "permission denied surfaces as DeliveryError");
    expect(platform.SendCalls() == 1, "permanent failure not retried");
}

void test_text_only_resend_failure_is_terminal() {
    ManualClock clock;
    FakePlatform platform(&clock);
    platform.FailNextSends(ErrorKind::kTransientTransport, 4);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    bool thrown = false;
    try {
        delivery.Deliver("thread-1", WithChart("chart"));
    } catch (const tfbot::delivery::DeliveryError&) {
        thrown = true;
    }
    expect(thrown, "failed text-only resend is terminal");
    expect(platform.SendCalls() == 4, "three attempts and one resend");
}

void test_later_chunk_failure_reports_progress() {
    ManualClock clock;
    FakePlatform platform(&clock);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    tfbot::bus::ResponsePayload payload;
    payload.text = std::string(2 * 1900, 'w');

    // The second chunk fails once the first one has been confirmed.
    bool thrown = false;
    try {
        delivery.Deliver("thread-1", payload, [&platform](const auto&) {
            platform.FailNextSends(ErrorKind::kTransientTransport, 1);
        });
    } catch (const tfbot::delivery::DeliveryError& e) {
        thrown = true;
        expect(e.DeliveredChunks() == 1, "one chunk delivered before failure");
        expect(e.FirstHandle().has_value() && e.FirstHandle()->id == "msg-1", "first handle kept");
    }
    expect(thrown, "later chunk failure surfaces");
    expect(platform.SendCalls() == 2, "later chunk not retried");
}

void test_attachment_only_payload() {
    ManualClock clock;
    FakePlatform platform(&clock);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    delivery.Deliver("thread-1", WithChart(""));
    const auto sent = platform.Sent();
    expect(sent.size() == 1 && sent[0].content.empty() && sent[0].attachment_count == 1,
           "attachment sent with empty text");

    bool thrown = false;
    try {
        delivery.Deliver("thread-1", tfbot::bus::ResponsePayload{});
    } catch (const tfbot::delivery::DeliveryError&) {
        thrown = true;
    }
    expect(thrown, "empty payload rejected");
}

void test_attachment_only_failure_skips_text_resend() {
    ManualClock clock;
    FakePlatform platform(&clock);
    platform.FailSendsWithAttachments(ErrorKind::kPayloadTooLarge);
    tfbot::delivery::ResponseDelivery delivery(platform, {}, clock);
    bool thrown = false;
    try {
        delivery.Deliver("thread-1", WithChart(""));
    } catch (const tfbot::delivery::DeliveryError& e) {
        thrown = true;
        expect(e.DeliveredChunks() == 0 && !e.FirstHandle().has_value(), "nothing delivered");
    }
    expect(thrown, "rejected attachment with no text is terminal");
    expect(platform.SendCalls() == 1, "no empty text-only resend");
    expect(platform.Sent().empty(), "no message posted");

    FakePlatform flaky(&clock);
    flaky.FailNextSends(ErrorKind::kTransientTransport, 3);
    tfbot::delivery::ResponseDelivery retrying(flaky, {}, clock);
    thrown = false;
    try {
        retrying.Deliver("thread-1", WithChart(""));
    } catch (const tfbot::delivery::DeliveryError&) {
        thrown = true;
    }
    expect(thrown, "exhausted retries with no text is terminal");
    expect(flaky.SendCalls() == 3, "three attempts and no resend");
}

}  // namespace

int main() {
    run_test("short_message_is_one_chunk", test_short_message_is_one_chunk);
    run_test("three_limits_make_three_chunks", test_three_limits_make_three_chunks);
    run_test("prefers_paragraph_then_sentence_then_word", test_prefers_paragraph_then_sentence_then_word);
    run_test("never_splits_utf8_sequence", test_never_splits_utf8_sequence);
    run_test("code_block_kept_together", test_code_block_kept_together);
    run_test("part_headers_numbered", test_part_headers_numbered);
    run_test("long_response_delivered_in_order_with_attachment_on_first",
             test_long_response_delivered_in_order_with_attachment_on_first);
    run_test("transient_failures_degrade_to_text_only", test_transient_failures_degrade_to_text_only);
    run_test("transient_failure_recovers_on_retry", test_transient_failure_recovers_on_retry);
    run_test("permanent_failure_with_attachment_degrades_immediately",
             test_permanent_failure_with_attachment_degrades_immediately);
    run_test("permanent_text_failure_is_terminal", test_permanent_text_failure_is_terminal);
    run_test("text_only_resend_failure_is_terminal", test_text_only_resend_failure_is_terminal);
    run_test("later_chunk_failure_reports_progress", test_later_chunk_failure_reports_progress);
    run_test("attachment_only_payload", test_attachment_only_payload);
    run_test("attachment_only_failure_skips_text_resend", test_attachment_only_failure_skips_text_resend);
    return tfbot::testing::finish("delivery_tests");
}
