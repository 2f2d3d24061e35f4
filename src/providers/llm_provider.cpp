#include "providers/llm_provider.hpp"

#include "providers/chat_completions_provider.hpp"

namespace tfbot::providers {

ProviderSettings ResolveProviderSettings(const tfbot::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.llm.model.empty() ? "x-ai/grok-3-mini-beta" : config.llm.model;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;
    settings.http_referer = config.providers.http_referer;
    settings.x_title = config.providers.x_title;

    const auto& openrouter = config.providers.openrouter;
    const auto& openai = config.providers.openai;
    if (!openrouter.api_key.empty()) {
        settings.api_key = openrouter.api_key;
        settings.api_base = openrouter.api_base.empty() ? "https://openrouter.ai/api/v1" : openrouter.api_base;
    } else if (!openai.api_key.empty()) {
        settings.api_key = openai.api_key;
        settings.api_base = openai.api_base.empty() ? "https://api.openai.com/v1" : openai.api_base;
    }
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const tfbot::config::Config& config) {
    return std::make_unique<ChatCompletionsProvider>(ResolveProviderSettings(config));
}

}  // namespace tfbot::providers
