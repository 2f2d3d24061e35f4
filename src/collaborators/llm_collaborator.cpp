#include "collaborators/llm_collaborator.hpp"

#include <utility>
#include <vector>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tfbot::collaborators {

LlmCollaborator::LlmCollaborator(providers::LLMProvider& provider,
                                 LlmCollaboratorOptions options,
                                 const store::MessageStore* history)
    : provider_(provider)
    , options_(std::move(options))
    , history_(history) {}

bus::ResponsePayload LlmCollaborator::Process(const bus::InboundEvent& event, const std::string& query) {
    std::vector<providers::Message> messages;
    if (!options_.system_prompt.empty()) {
        messages.push_back({"system", options_.system_prompt});
    }
    AppendThreadHistory(event, messages);
    messages.push_back({"user", query});

    utils::LogDebug("llm", "event " + event.event_id + " from " + event.author_id
        + " query length " + std::to_string(query.size())
        + " messages " + std::to_string(messages.size()));

    const auto response = provider_.Chat(messages, options_.model, options_.max_tokens, options_.temperature);
    if (response.IsError()) {
        throw CollaboratorError(response.content);
    }
    if (utils::Trim(response.content).empty()) {
        throw CollaboratorError("LLM returned an empty response");
    }

    bus::ResponsePayload payload;
    payload.text = response.content;
    return payload;
}

void LlmCollaborator::AppendThreadHistory(const bus::InboundEvent& event,
                                          std::vector<providers::Message>& messages) const {
    if (!history_ || !event.in_thread || options_.thread_history == 0) {
        return;
    }
    std::vector<store::ExchangeRecord> records;
    try {
        records = history_->RecentExchangesForDestination(event.channel_id, options_.thread_history);
    } catch (const store::StoreError& e) {
        utils::LogWarn("llm", "thread history unavailable for " + event.channel_id + ": " + e.what());
        return;
    }
    // Newest first from the store; the prompt reads oldest first.
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        messages.push_back({"user", it->query});
        messages.push_back({"assistant", it->response});
    }
    if (!records.empty()) {
        utils::LogDebug("llm", "replaying " + std::to_string(records.size())
            + " exchange(s) from thread " + event.channel_id);
    }
}

}  // namespace tfbot::collaborators
