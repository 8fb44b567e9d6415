#include "replay_cache.hpp"
#include "metrics.hpp"

namespace powshield {

MemoryReplayCache::MemoryReplayCache(size_t capacity, std::chrono::seconds default_ttl, Clock clock)
    : ReplayCache(default_ttl)
    , capacity_(capacity == 0 ? 1 : capacity)
    , clock_(std::move(clock))
{}

// An entry is live through its expiry instant inclusive.
bool MemoryReplayCache::live_locked(const std::string& key, TimePoint now) {
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    if (now > it->second->expires_at) {
        lru_.erase(it->second);
        index_.erase(it);
        return false;
    }
    return true;
}

void MemoryReplayCache::insert_locked(const std::string& key, TimePoint expires_at) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        lru_.erase(it->second);
        index_.erase(it);
    }

    while (index_.size() >= capacity_ && !lru_.empty()) {
        index_.erase(lru_.back().key);
        lru_.pop_back();
    }

    lru_.push_front(Entry{key, expires_at});
    index_[key] = lru_.begin();
}

bool MemoryReplayCache::seen(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_locked(key, clock_());
}

void MemoryReplayCache::mark(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(key, clock_() + ttl);
}

bool MemoryReplayCache::check_and_mark(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    if (live_locked(key, now)) return false;
    insert_locked(key, now + ttl);
    return true;
}

void MemoryReplayCache::purge_expired() {
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        for (auto it = lru_.begin(); it != lru_.end();) {
            if (now > it->expires_at) {
                index_.erase(it->key);
                it = lru_.erase(it);
            } else {
                ++it;
            }
        }
        remaining = index_.size();
    }
    MetricsRegistry::instance().set_gauge("replay_cache_entries", static_cast<double>(remaining));
}

size_t MemoryReplayCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

}
