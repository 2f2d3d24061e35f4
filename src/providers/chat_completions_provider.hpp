#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "providers/llm_provider.hpp"

namespace tfbot::providers {

struct Endpoint {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path_prefix;

    std::string Origin() const;
};

// Accepts "https://host[:port]/prefix"; a missing scheme means https.
Endpoint ParseEndpoint(const std::string& base_url);

nlohmann::json BuildChatRequest(const std::vector<Message>& messages,
                                const std::string& model,
                                int max_tokens,
                                double temperature);

// Reads choices[0] and usage from a /chat/completions body. A malformed
// body yields an error response.
LLMResponse ParseChatResponse(const std::string& body);

// Client for any service speaking the OpenAI /chat/completions dialect.
class ChatCompletionsProvider : public LLMProvider {
public:
    explicit ChatCompletionsProvider(ProviderSettings settings);

    LLMResponse Chat(const std::vector<Message>& messages,
                     const std::string& model,
                     int max_tokens,
                     double temperature) override;

private:
    ProviderSettings settings_;
    Endpoint endpoint_;
};

}  // namespace tfbot::providers
