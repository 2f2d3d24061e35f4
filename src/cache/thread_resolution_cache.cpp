#include "cache/thread_resolution_cache.hpp"

#include <algorithm>

namespace tfbot::cache {

ThreadResolutionCache::ThreadResolutionCache(std::size_t max_size)
    : max_size_(std::max<std::size_t>(max_size, 1)) {}

std::optional<std::string> ThreadResolutionCache::Resolve(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ThreadResolutionCache::Register(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(key, value);
    if (!inserted) {
        return it->second;
    }
    order_.push_back(key);
    if (entries_.size() > max_size_) {
        EvictLocked();
    }
    return value;
}

std::size_t ThreadResolutionCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ThreadResolutionCache::EvictLocked() {
    const auto to_drop = std::max<std::size_t>(1, max_size_ / 2);
    for (std::size_t i = 0; i < to_drop && !order_.empty(); ++i) {
        entries_.erase(order_.front());
        order_.pop_front();
    }
}

}  // namespace tfbot::cache
