#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tfbot::cache {

// Maps an originating event id to the thread resolved for it. Same locking
// and batch eviction rules as DedupCache.
class ThreadResolutionCache {
public:
    explicit ThreadResolutionCache(std::size_t max_size);

    std::optional<std::string> Resolve(const std::string& key) const;

    // First writer wins: returns the value now stored for the key, which is
    // the existing one when another caller registered first.
    std::string Register(const std::string& key, const std::string& value);

    std::size_t Size() const;
    std::size_t MaxSize() const { return max_size_; }

private:
    void EvictLocked();

    std::size_t max_size_;
    std::unordered_map<std::string, std::string> entries_;
    std::deque<std::string> order_;
    mutable std::mutex mutex_;
};

}  // namespace tfbot::cache
