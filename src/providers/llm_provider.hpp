#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace tfbot::providers {

struct Message {
    std::string role;
    std::string content;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
};

struct ProviderSettings {
    std::string api_key;
    std::string api_base;
    std::string model;
    bool use_proxy_for_llm = false;
    std::string http_referer;
    std::string x_title;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    // Failures come back as a response with finish_reason "error".
    virtual LLMResponse Chat(const std::vector<Message>& messages,
                             const std::string& model,
                             int max_tokens,
                             double temperature) = 0;
};

ProviderSettings ResolveProviderSettings(const tfbot::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(const tfbot::config::Config& config);

}  // namespace tfbot::providers
