#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace tfbot::cache {

// Bounded set of recently seen trigger keys. Once the bound is exceeded the
// oldest half (by insertion order) is dropped in one batch.
class DedupCache {
public:
    explicit DedupCache(std::size_t max_size);

    // True when the key was newly registered, false when it was already present.
    // The lookup and the insert happen under one lock.
    bool CheckAndRegister(const std::string& key);

    std::size_t Size() const;
    std::size_t MaxSize() const { return max_size_; }

private:
    void EvictLocked();

    std::size_t max_size_;
    std::unordered_set<std::string> keys_;
    std::deque<std::string> order_;
    mutable std::mutex mutex_;
};

}  // namespace tfbot::cache
