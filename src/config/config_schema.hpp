#pragma once

#include <string>
#include <vector>

namespace tfbot::config {

struct DiscordConfig {
    bool enabled = false;
    std::string token;
    std::vector<std::string> allow_from;
};

struct DedupConfig {
    int message_cache_size = 1000;
    int command_cache_size = 500;
    int thread_cache_size = 500;
};

struct ThreadsConfig {
    int poll_initial_ms = 200;
    double poll_multiplier = 1.5;
    int poll_max_interval_ms = 2000;
    int poll_timeout_ms = 5000;
    std::string name_prefix = "Bot Response - ";
    int auto_archive_minutes = 1440;
};

struct DeliveryConfig {
    int platform_limit = 2000;
    int chunk_length = 1900;
    int max_attempts = 3;
    int backoff_base_ms = 1000;
};

struct RateLimitSettings {
    bool enabled = true;
    int cooldown_s = 10;
    int max_per_minute = 6;
    int max_users_tracked = 10000;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig openrouter;
    ProviderConfig openai;
    bool use_proxy_for_llm = false;
    // Sent as HTTP-Referer and X-Title so OpenRouter can attribute requests.
    std::string http_referer = "https://techfren.net";
    std::string x_title = "TechFren Discord Bot";
};

struct LlmConfig {
    std::string model = "x-ai/grok-3-mini-beta";
    int max_tokens = 2048;
    double temperature = 0.7;
    std::string system_prompt =
        "You are a helpful assistant in a Discord server. Answer clearly and concisely.";
    // Exchanges replayed as context for a question asked inside a thread.
    int thread_history = 4;
};

struct StoreConfig {
    bool enabled = true;
    std::string path = "~/.tfbot/messages.db";
};

struct LoggingConfig {
    std::string level = "info";
};

struct WorkersConfig {
    int threads = 4;
};

struct MessagesConfig {
    std::string processing = "Processing your request, please wait...";
    std::string processing_error =
        "Sorry, an error occurred while processing your request. Please try again later.";
    std::string no_query = "Please provide a query after mentioning the bot.";
    std::string rate_limit_cooldown =
        "Please wait {seconds} seconds before making another request.";
    std::string rate_limit_exceeded =
        "You've reached the maximum number of requests per minute. Please try again in {seconds} seconds.";
};

struct Config {
    DiscordConfig discord;
    DedupConfig dedup;
    ThreadsConfig threads;
    DeliveryConfig delivery;
    RateLimitSettings rate_limit;
    ProvidersConfig providers;
    LlmConfig llm;
    StoreConfig store;
    LoggingConfig logging;
    WorkersConfig workers;
    MessagesConfig messages;
};

}  // namespace tfbot::config
