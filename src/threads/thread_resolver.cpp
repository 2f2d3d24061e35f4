#include "threads/thread_resolver.hpp"

#include <functional>
#include <utility>

#include "utils/logging.hpp"

namespace tfbot::threads {
namespace {

constexpr const char* kTag = "resolver";

}  // namespace

std::string BuildThreadName(const std::string& prefix, const std::string& author_name) {
    auto name = prefix + (author_name.empty() ? std::string("user") : author_name);
    if (name.size() <= kMaxThreadNameLength) {
        return name;
    }
    auto cut = kMaxThreadNameLength;
    // Back off to a UTF-8 lead byte so the name stays valid.
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    name.resize(cut);
    return name;
}

ThreadResolver::ThreadResolver(platform::Platform& platform,
                               cache::ThreadResolutionCache& cache,
                               ThreadResolverOptions options,
                               utils::Clock& clock)
    : platform_(platform)
    , cache_(cache)
    , options_(std::move(options))
    , clock_(clock) {}

std::optional<platform::Thread> ThreadResolver::Resolve(const bus::InboundEvent& event) {
    if (event.in_thread) {
        return platform::Thread{event.channel_id, event.channel_id, ""};
    }

    if (auto cached = cache_.Resolve(event.event_id)) {
        utils::LogDebug(kTag, "cache hit for event " + event.event_id + " -> " + *cached);
        return platform::Thread{*cached, event.channel_id, ""};
    }

    if (!event.guild_id) {
        // Direct messages cannot host threads.
        return std::nullopt;
    }

    if (event.has_attachments) {
        if (auto existing = WaitForPlatformThread(event)) {
            utils::LogInfo(kTag, "adopted platform thread " + existing->id
                + " for event " + event.event_id);
            return Remember(event, std::move(*existing));
        }
    }

    return CreateThread(event);
}

std::optional<platform::Thread> ThreadResolver::WaitForPlatformThread(
    const bus::InboundEvent& event) {
    std::function<std::optional<platform::Thread>()> lookup = [this, &event]() {
        return platform_.FetchExistingThread(event);
    };
    try {
        return utils::PollUntil<platform::Thread>(lookup, options_.poll, clock_);
    } catch (const platform::PlatformError& e) {
        utils::LogWarn(kTag, "thread lookup failed for event " + event.event_id
            + " (" + platform::ToString(e.Kind()) + "): " + e.what());
        return std::nullopt;
    }
}

std::optional<platform::Thread> ThreadResolver::CreateThread(const bus::InboundEvent& event) {
    const auto name = BuildThreadName(options_.name_prefix, event.author_name);
    try {
        auto created = platform_.CreateThread(event, name);
        utils::LogInfo(kTag, "created thread " + created.id + " for event " + event.event_id);
        return Remember(event, std::move(created));
    } catch (const platform::PlatformError& e) {
        if (e.Kind() == platform::ErrorKind::kAlreadyExists) {
            utils::LogInfo(kTag, "thread already exists for event " + event.event_id
                + ", adopting it");
            return AdoptExisting(event);
        }
        utils::LogWarn(kTag, "thread creation failed for event " + event.event_id
            + " (" + platform::ToString(e.Kind()) + "): " + e.what()
            + "; replying in channel");
        return std::nullopt;
    }
}

std::optional<platform::Thread> ThreadResolver::AdoptExisting(const bus::InboundEvent& event) {
    try {
        if (auto existing = platform_.FetchExistingThread(event)) {
            return Remember(event, std::move(*existing));
        }
    } catch (const platform::PlatformError& e) {
        utils::LogWarn(kTag, "fetching existing thread failed for event " + event.event_id
            + ": " + e.what());
    }
    // Another lifecycle in this process may have registered the winner.
    if (auto cached = cache_.Resolve(event.event_id)) {
        return platform::Thread{*cached, event.channel_id, ""};
    }
    utils::LogWarn(kTag, "existing thread for event " + event.event_id
        + " is not visible; replying in channel");
    return std::nullopt;
}

platform::Thread ThreadResolver::Remember(const bus::InboundEvent& event, platform::Thread thread) {
    const auto winner = cache_.Register(event.event_id, thread.id);
    if (winner != thread.id) {
        return platform::Thread{winner, event.channel_id, ""};
    }
    return thread;
}

}  // namespace tfbot::threads
