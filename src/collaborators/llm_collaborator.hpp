#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "collaborators/collaborator.hpp"
#include "providers/llm_provider.hpp"
#include "store/message_store.hpp"

namespace tfbot::collaborators {

struct LlmCollaboratorOptions {
    std::string model;
    int max_tokens = 2048;
    double temperature = 0.7;
    std::string system_prompt;
    // Earlier exchanges replayed for a question asked inside a thread. 0 disables.
    std::size_t thread_history = 4;
};

class LlmCollaborator : public Collaborator {
public:
    // `history` may be null; questions are then answered without thread memory.
    LlmCollaborator(providers::LLMProvider& provider,
                    LlmCollaboratorOptions options,
                    const store::MessageStore* history = nullptr);

    bus::ResponsePayload Process(const bus::InboundEvent& event, const std::string& query) override;

private:
    void AppendThreadHistory(const bus::InboundEvent& event, std::vector<providers::Message>& messages) const;

    providers::LLMProvider& provider_;
    LlmCollaboratorOptions options_;
    const store::MessageStore* history_;
};

}  // namespace tfbot::collaborators
