#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include <boost/asio/thread_pool.hpp>

#include "bus/message_bus.hpp"
#include "cache/dedup_cache.hpp"
#include "cache/thread_resolution_cache.hpp"
#include "channels/discord_channel.hpp"
#include "collaborators/llm_collaborator.hpp"
#include "config/config_loader.hpp"
#include "coordinator/command_coordinator.hpp"
#include "delivery/response_delivery.hpp"
#include "providers/llm_provider.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "store/sqlite_message_store.hpp"
#include "threads/thread_resolver.hpp"
#include "utils/clock.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return tfbot::config::GetConfigDir() / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    const auto path = GetPidFilePath();
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

void ConfigureLogging(const tfbot::config::Config& config) {
    tfbot::utils::LogConfig log_config{};
    if (const auto level = tfbot::utils::ParseLogLevel(config.logging.level)) {
        log_config.min_level = *level;
    }
    tfbot::utils::SetLogConfig(log_config);
}

tfbot::collaborators::LlmCollaboratorOptions CollaboratorOptions(const tfbot::config::Config& config) {
    tfbot::collaborators::LlmCollaboratorOptions options{};
    options.model = config.llm.model;
    options.max_tokens = config.llm.max_tokens;
    options.temperature = config.llm.temperature;
    options.system_prompt = config.llm.system_prompt;
    options.thread_history = static_cast<std::size_t>(std::max(config.llm.thread_history, 0));
    return options;
}

int RunGateway() {
    auto config = tfbot::config::LoadConfig();
    const auto problems = tfbot::config::ValidateConfig(config);
    if (!config.discord.enabled) {
        std::cout << "Discord is not enabled; set discord.token or TFBOT_DISCORD_TOKEN." << std::endl;
        return 1;
    }
    if (!problems.empty()) {
        std::cout << "Configuration problems:" << std::endl;
        for (const auto& problem : problems) {
            std::cout << "  - " << problem << std::endl;
        }
        return 1;
    }
    ConfigureLogging(config);

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "tfbot gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    std::unique_ptr<tfbot::store::SqliteMessageStore> store;
    if (config.store.enabled) {
        store = std::make_unique<tfbot::store::SqliteMessageStore>(
            tfbot::config::ExpandHome(config.store.path));
        if (!store->IsOpen()) {
            tfbot::utils::LogWarn("gateway", "message store unavailable; exchanges will not be recorded");
        }
    }
    const tfbot::store::MessageStore* history = store && store->IsOpen() ? store.get() : nullptr;

    auto provider = tfbot::providers::CreateProvider(config);
    tfbot::collaborators::LlmCollaborator collaborator(*provider, CollaboratorOptions(config), history);

    tfbot::bus::MessageBus bus;
    tfbot::channels::DiscordChannel discord(config.discord, config.threads, bus);
    auto& clock = tfbot::utils::DefaultClock();

    tfbot::cache::DedupCache message_dedup(static_cast<std::size_t>(config.dedup.message_cache_size));
    tfbot::cache::DedupCache command_dedup(static_cast<std::size_t>(config.dedup.command_cache_size));
    tfbot::cache::ThreadResolutionCache thread_cache(static_cast<std::size_t>(config.dedup.thread_cache_size));

    tfbot::threads::ThreadResolverOptions resolver_options{};
    resolver_options.poll.initial_interval = std::chrono::milliseconds(config.threads.poll_initial_ms);
    resolver_options.poll.multiplier = config.threads.poll_multiplier;
    resolver_options.poll.max_interval = std::chrono::milliseconds(config.threads.poll_max_interval_ms);
    resolver_options.poll.timeout = std::chrono::milliseconds(config.threads.poll_timeout_ms);
    resolver_options.name_prefix = config.threads.name_prefix;
    tfbot::threads::ThreadResolver resolver(discord, thread_cache, resolver_options, clock);

    tfbot::delivery::DeliveryOptions delivery_options{};
    delivery_options.platform_limit = static_cast<std::size_t>(config.delivery.platform_limit);
    delivery_options.chunk_length = static_cast<std::size_t>(config.delivery.chunk_length);
    delivery_options.max_attempts = config.delivery.max_attempts;
    delivery_options.backoff_base = std::chrono::milliseconds(config.delivery.backoff_base_ms);
    tfbot::delivery::ResponseDelivery delivery(discord, delivery_options, clock);

    tfbot::ratelimit::RateLimitConfig limit_config{};
    limit_config.enabled = config.rate_limit.enabled;
    limit_config.cooldown_s = config.rate_limit.cooldown_s;
    limit_config.max_per_minute = config.rate_limit.max_per_minute;
    limit_config.max_users_tracked = static_cast<std::size_t>(config.rate_limit.max_users_tracked);
    tfbot::ratelimit::RateLimiter rate_limiter(limit_config, clock);

    boost::asio::thread_pool pool(static_cast<std::size_t>(config.workers.threads));
    tfbot::coordinator::CommandCoordinator coordinator(
        tfbot::coordinator::CommandCoordinator::Dependencies{
            .platform = discord,
            .message_dedup = message_dedup,
            .command_dedup = command_dedup,
            .resolver = resolver,
            .delivery = delivery,
            .collaborator = collaborator,
            .store = store.get(),
            .rate_limiter = &rate_limiter},
        tfbot::coordinator::CoordinatorOptions{.bot_user_id = "", .messages = config.messages},
        pool);
    coordinator.SetObserver([](const std::string& event_id, tfbot::coordinator::LifecycleState state) {
        tfbot::utils::LogDebug("coordinator", "event " + event_id + " -> "
            + tfbot::coordinator::ToString(state));
    });
    discord.SetReadyCallback([&coordinator](const std::string& bot_user_id) {
        coordinator.SetBotUserId(bot_user_id);
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::thread dispatcher([&bus, &coordinator]() {
        tfbot::bus::InboundEvent event;
        while (true) {
            if (bus.TryConsumeInbound(event, std::chrono::milliseconds(500))) {
                coordinator.Submit(event);
            } else if (bus.IsStopped()) {
                break;
            }
        }
    });

    discord.Start();
    std::cout << "tfbot gateway started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    tfbot::utils::LogInfo("gateway", "shutting down (signal " + std::to_string(g_signal) + ")");
    discord.Stop();
    bus.Stop();
    if (dispatcher.joinable()) {
        dispatcher.join();
    }
    pool.join();
    RemovePidFile();
    return 0;
}

int ShowStatus() {
    const auto config = tfbot::config::LoadConfig();
    const auto config_path = tfbot::config::GetConfigPath();
    std::cout << "config: " << config_path.string()
              << (std::filesystem::exists(config_path) ? "" : " (missing, using defaults)") << std::endl;
    std::cout << "discord: " << (config.discord.enabled ? "enabled" : "disabled")
              << ", token " << (config.discord.token.empty() ? "not set" : "set")
              << ", allowFrom " << config.discord.allow_from.size() << " entries" << std::endl;
    std::cout << "llm: " << config.llm.model
              << " (openrouter key " << (config.providers.openrouter.api_key.empty() ? "not set" : "set")
              << ", openai key " << (config.providers.openai.api_key.empty() ? "not set" : "set")
              << ")" << std::endl;
    std::cout << "dedup: message " << config.dedup.message_cache_size
              << ", command " << config.dedup.command_cache_size
              << ", thread " << config.dedup.thread_cache_size << std::endl;
    std::cout << "delivery: chunk " << config.delivery.chunk_length << "/" << config.delivery.platform_limit
              << ", attempts " << config.delivery.max_attempts
              << ", backoff " << config.delivery.backoff_base_ms << "ms" << std::endl;
    std::cout << "store: " << (config.store.enabled ? tfbot::config::ExpandHome(config.store.path) : "disabled")
              << std::endl;

    const auto pid = ReadPidFile();
    if (pid && IsProcessRunning(*pid)) {
        std::cout << "gateway: running (pid=" << *pid << ")" << std::endl;
    } else {
        std::cout << "gateway: not running" << std::endl;
    }

    const auto problems = tfbot::config::ValidateConfig(config);
    for (const auto& problem : problems) {
        std::cout << "problem: " << problem << std::endl;
    }
    return problems.empty() ? 0 : 1;
}

int AskOnce(const std::string& question) {
    const auto config = tfbot::config::LoadConfig();
    ConfigureLogging(config);
    auto provider = tfbot::providers::CreateProvider(config);
    tfbot::collaborators::LlmCollaborator collaborator(*provider, CollaboratorOptions(config));

    tfbot::bus::InboundEvent event{};
    event.event_id = "cli";
    event.author_id = "cli";
    event.author_name = "cli";
    event.channel_id = "cli";
    event.content = question;

    try {
        const auto response = collaborator.Process(event, question);
        std::cout << response.text << std::endl;
    } catch (const tfbot::collaborators::CollaboratorError& e) {
        std::cout << e.what() << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "gateway") {
        return RunGateway();
    }

    if (argc >= 2 && std::string(argv[1]) == "status") {
        return ShowStatus();
    }

    if (argc < 2) {
        std::cout << "Usage: tfbot gateway | tfbot status | tfbot \"question\"" << std::endl;
        return 1;
    }

    return AskOnce(argv[1]);
}
