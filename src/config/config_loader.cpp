#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tfbot::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

const nlohmann::json* Section(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_object()) {
        return &data[key];
    }
    return nullptr;
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "apiKey", target.api_key);
    ReadString(source, "apiBase", target.api_base);
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigDir() {
    return GetHomePath() / ".tfbot";
}

std::filesystem::path GetConfigPath() {
    return GetConfigDir() / "config.json";
}

std::string ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (const auto* discord = Section(data, "discord")) {
        ReadBool(*discord, "enabled", config.discord.enabled);
        ReadString(*discord, "token", config.discord.token);
        if (discord->contains("allowFrom") && (*discord)["allowFrom"].is_array()) {
            config.discord.allow_from.clear();
            for (const auto& item : (*discord)["allowFrom"]) {
                if (item.is_string()) {
                    config.discord.allow_from.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (const auto* dedup = Section(data, "dedup")) {
        ReadInt(*dedup, "messageCacheSize", config.dedup.message_cache_size);
        ReadInt(*dedup, "commandCacheSize", config.dedup.command_cache_size);
        ReadInt(*dedup, "threadCacheSize", config.dedup.thread_cache_size);
    }

    if (const auto* threads = Section(data, "threads")) {
        ReadInt(*threads, "pollInitialMs", config.threads.poll_initial_ms);
        ReadDouble(*threads, "pollMultiplier", config.threads.poll_multiplier);
        ReadInt(*threads, "pollMaxIntervalMs", config.threads.poll_max_interval_ms);
        ReadInt(*threads, "pollTimeoutMs", config.threads.poll_timeout_ms);
        ReadString(*threads, "namePrefix", config.threads.name_prefix);
        ReadInt(*threads, "autoArchiveMinutes", config.threads.auto_archive_minutes);
    }

    if (const auto* delivery = Section(data, "delivery")) {
        ReadInt(*delivery, "platformLimit", config.delivery.platform_limit);
        ReadInt(*delivery, "chunkLength", config.delivery.chunk_length);
        ReadInt(*delivery, "maxAttempts", config.delivery.max_attempts);
        ReadInt(*delivery, "backoffBaseMs", config.delivery.backoff_base_ms);
    }

    if (const auto* rate_limit = Section(data, "rateLimit")) {
        ReadBool(*rate_limit, "enabled", config.rate_limit.enabled);
        ReadInt(*rate_limit, "cooldownS", config.rate_limit.cooldown_s);
        ReadInt(*rate_limit, "maxPerMinute", config.rate_limit.max_per_minute);
        ReadInt(*rate_limit, "maxUsersTracked", config.rate_limit.max_users_tracked);
    }

    if (const auto* providers = Section(data, "providers")) {
        ReadBool(*providers, "useProxyForLLM", config.providers.use_proxy_for_llm);
        ReadString(*providers, "httpReferer", config.providers.http_referer);
        ReadString(*providers, "xTitle", config.providers.x_title);
        if (providers->contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, (*providers)["openrouter"]);
        }
        if (providers->contains("openai")) {
            ApplyProviderConfig(config.providers.openai, (*providers)["openai"]);
        }
    }

    if (const auto* llm = Section(data, "llm")) {
        ReadString(*llm, "model", config.llm.model);
        ReadInt(*llm, "maxTokens", config.llm.max_tokens);
        ReadDouble(*llm, "temperature", config.llm.temperature);
        ReadString(*llm, "systemPrompt", config.llm.system_prompt);
        ReadInt(*llm, "threadHistory", config.llm.thread_history);
    }

    if (const auto* store = Section(data, "store")) {
        ReadBool(*store, "enabled", config.store.enabled);
        ReadString(*store, "path", config.store.path);
    }

    if (const auto* logging = Section(data, "logging")) {
        ReadString(*logging, "level", config.logging.level);
    }

    if (const auto* workers = Section(data, "workers")) {
        ReadInt(*workers, "threads", config.workers.threads);
    }

    if (const auto* messages = Section(data, "messages")) {
        ReadString(*messages, "processing", config.messages.processing);
        ReadString(*messages, "processingError", config.messages.processing_error);
        ReadString(*messages, "noQuery", config.messages.no_query);
        ReadString(*messages, "rateLimitCooldown", config.messages.rate_limit_cooldown);
        ReadString(*messages, "rateLimitExceeded", config.messages.rate_limit_exceeded);
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto discord_enabled = GetEnv("TFBOT_DISCORD_ENABLED");
    if (!discord_enabled.empty()) {
        config.discord.enabled = ParseBool(discord_enabled);
    }

    const auto discord_token = GetEnv("TFBOT_DISCORD_TOKEN");
    if (!discord_token.empty()) {
        config.discord.token = discord_token;
        config.discord.enabled = true;
    }

    const auto allow_from = GetEnv("TFBOT_DISCORD_ALLOW_FROM");
    if (!allow_from.empty()) {
        config.discord.allow_from = utils::SplitCsv(allow_from);
    }

    const auto openrouter_key = GetEnv("TFBOT_PROVIDERS__OPENROUTER__API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto openrouter_base = GetEnv("TFBOT_PROVIDERS__OPENROUTER__API_BASE");
    if (!openrouter_base.empty()) {
        config.providers.openrouter.api_base = openrouter_base;
    }

    const auto openai_key = GetEnv("TFBOT_PROVIDERS__OPENAI__API_KEY");
    if (!openai_key.empty()) {
        config.providers.openai.api_key = openai_key;
    }

    const auto use_proxy_for_llm = GetEnv("TFBOT_PROVIDERS__USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    const auto http_referer = GetEnv("TFBOT_PROVIDERS__HTTP_REFERER");
    if (!http_referer.empty()) {
        config.providers.http_referer = http_referer;
    }

    const auto x_title = GetEnv("TFBOT_PROVIDERS__X_TITLE");
    if (!x_title.empty()) {
        config.providers.x_title = x_title;
    }

    const auto model = GetEnv("TFBOT_LLM__MODEL");
    if (!model.empty()) {
        config.llm.model = model;
    }

    const auto store_path = GetEnv("TFBOT_STORE__PATH");
    if (!store_path.empty()) {
        config.store.path = store_path;
    }

    const auto log_level = GetEnv("TFBOT_LOGGING__LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto worker_threads = GetEnv("TFBOT_WORKERS__THREADS");
    if (!worker_threads.empty()) {
        config.workers.threads = ParseInt(worker_threads, config.workers.threads);
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};
    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::LogWarn("config", "ignoring malformed " + path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }
    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

std::vector<std::string> ValidateConfig(const Config& config) {
    std::vector<std::string> problems;

    if (config.discord.enabled && config.discord.token.empty()) {
        problems.push_back("discord.token is required when discord is enabled");
    }
    if (config.dedup.message_cache_size <= 0 || config.dedup.command_cache_size <= 0
        || config.dedup.thread_cache_size <= 0) {
        problems.push_back("dedup cache sizes must be positive");
    }
    if (config.threads.poll_initial_ms <= 0 || config.threads.poll_max_interval_ms <= 0
        || config.threads.poll_timeout_ms <= 0) {
        problems.push_back("threads poll timings must be positive");
    }
    if (config.threads.poll_multiplier < 1.0) {
        problems.push_back("threads.pollMultiplier must be at least 1.0");
    }
    if (config.delivery.platform_limit <= 0 || config.delivery.chunk_length <= 0) {
        problems.push_back("delivery.platformLimit and delivery.chunkLength must be positive");
    } else if (config.delivery.chunk_length > config.delivery.platform_limit - 32) {
        problems.push_back("delivery.chunkLength must leave at least 32 characters below delivery.platformLimit");
    }
    if (config.delivery.max_attempts <= 0) {
        problems.push_back("delivery.maxAttempts must be positive");
    }
    if (config.delivery.backoff_base_ms < 0) {
        problems.push_back("delivery.backoffBaseMs must not be negative");
    }
    if (config.rate_limit.cooldown_s < 0 || config.rate_limit.max_per_minute <= 0
        || config.rate_limit.max_users_tracked <= 0) {
        problems.push_back("rateLimit values must be positive");
    }
    if (config.llm.thread_history < 0) {
        problems.push_back("llm.threadHistory must not be negative");
    }
    if (config.workers.threads <= 0) {
        problems.push_back("workers.threads must be positive");
    }
    if (!utils::ParseLogLevel(config.logging.level)) {
        problems.push_back("logging.level must be one of debug, info, warn, error");
    }
    if (config.providers.openrouter.api_key.empty() && config.providers.openai.api_key.empty()) {
        problems.push_back("an LLM API key is required (providers.openrouter or providers.openai)");
    }

    return problems;
}

}  // namespace tfbot::config
