#include "cache/dedup_cache.hpp"

#include <algorithm>

namespace tfbot::cache {

DedupCache::DedupCache(std::size_t max_size)
    : max_size_(std::max<std::size_t>(max_size, 1)) {}

bool DedupCache::CheckAndRegister(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!keys_.insert(key).second) {
        return false;
    }
    order_.push_back(key);
    if (keys_.size() > max_size_) {
        EvictLocked();
    }
    return true;
}

std::size_t DedupCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

void DedupCache::EvictLocked() {
    const auto to_drop = std::max<std::size_t>(1, max_size_ / 2);
    for (std::size_t i = 0; i < to_drop && !order_.empty(); ++i) {
        keys_.erase(order_.front());
        order_.pop_front();
    }
}

}  // namespace tfbot::cache
