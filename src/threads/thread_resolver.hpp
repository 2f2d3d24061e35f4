#pragma once

#include <optional>
#include <string>

#include "bus/events.hpp"
#include "cache/thread_resolution_cache.hpp"
#include "platform/platform.hpp"
#include "utils/clock.hpp"
#include "utils/poll.hpp"

namespace tfbot::threads {

struct ThreadResolverOptions {
    utils::PollOptions poll;
    std::string name_prefix = "Bot Response - ";
};

// Discord rejects thread names longer than this.
inline constexpr std::size_t kMaxThreadNameLength = 100;

std::string BuildThreadName(const std::string& prefix, const std::string& author_name);

// Produces the destination thread for an event. Never yields two different
// threads for the same event id: a lost creation race falls back to the
// thread that won it.
class ThreadResolver {
public:
    ThreadResolver(platform::Platform& platform,
                   cache::ThreadResolutionCache& cache,
                   ThreadResolverOptions options,
                   utils::Clock& clock);

    // std::nullopt means "reply in the originating channel".
    std::optional<platform::Thread> Resolve(const bus::InboundEvent& event);

private:
    std::optional<platform::Thread> WaitForPlatformThread(const bus::InboundEvent& event);
    std::optional<platform::Thread> CreateThread(const bus::InboundEvent& event);
    std::optional<platform::Thread> AdoptExisting(const bus::InboundEvent& event);
    platform::Thread Remember(const bus::InboundEvent& event, platform::Thread thread);

    platform::Platform& platform_;
    cache::ThreadResolutionCache& cache_;
    ThreadResolverOptions options_;
    utils::Clock& clock_;
};

}  // namespace tfbot::threads
