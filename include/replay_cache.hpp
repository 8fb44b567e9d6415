#pragma once

#include <chrono>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

#include "clock.hpp"

namespace powshield {

// Single-use marker store for timestamp:nonce keys.
// Implementations must make check_and_mark atomic: of two concurrent callers
// with the same key, exactly one gets true.
class ReplayCache {
public:
    explicit ReplayCache(std::chrono::seconds default_ttl) : default_ttl_(default_ttl) {}
    virtual ~ReplayCache() = default;

    ReplayCache(const ReplayCache&) = delete;
    ReplayCache& operator=(const ReplayCache&) = delete;

    // True if the key is marked and not yet expired.
    virtual bool seen(const std::string& key) = 0;

    // Marks the key unconditionally, replacing any previous lifetime.
    virtual void mark(const std::string& key, std::chrono::seconds ttl) = 0;

    /**
     * Marks the key only if it is not currently live.
     * @return true if this call marked the key, false if it was already present.
     */
    virtual bool check_and_mark(const std::string& key, std::chrono::seconds ttl) = 0;

    // Drops expired entries eagerly. Lookups ignore expired entries regardless.
    virtual void purge_expired() {}

    virtual size_t size() const = 0;

    void mark(const std::string& key) { mark(key, default_ttl_); }
    bool check_and_mark(const std::string& key) { return check_and_mark(key, default_ttl_); }

    std::chrono::seconds default_ttl() const { return default_ttl_; }

private:
    std::chrono::seconds default_ttl_;
};

// In-process replay cache: bounded LRU with per-entry expiry under one mutex.
class MemoryReplayCache : public ReplayCache {
public:
    MemoryReplayCache(size_t capacity, std::chrono::seconds default_ttl,
                      Clock clock = system_clock_source());

    bool seen(const std::string& key) override;
    void mark(const std::string& key, std::chrono::seconds ttl) override;
    bool check_and_mark(const std::string& key, std::chrono::seconds ttl) override;
    void purge_expired() override;
    size_t size() const override;

    using ReplayCache::mark;
    using ReplayCache::check_and_mark;

    size_t capacity() const { return capacity_; }

private:
    using TimePoint = std::chrono::system_clock::time_point;

    struct Entry {
        std::string key;
        TimePoint expires_at;
    };

    // Caller holds mutex_.
    bool live_locked(const std::string& key, TimePoint now);
    void insert_locked(const std::string& key, TimePoint expires_at);

    size_t capacity_;
    Clock clock_;
    std::list<Entry> lru_;  // front = most recently marked
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

}
