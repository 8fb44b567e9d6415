#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <chrono>
#include <sw/redis++/redis++.h>

#include "rate_limiter.hpp"
#include "replay_cache.hpp"

namespace powshield {

// Redis connection shared by every edge instance that points at the same server.
// Provides the atomic primitives behind RedisReplayCache and RedisRateLimiter.
class RedisManager {
public:
    explicit RedisManager(const std::string& redis_url, const std::string& key_prefix = "powshield:");
    ~RedisManager() = default;

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    bool is_connected() const { return connected_; }

    // SET NX PX. Returns true if the key was newly set. Throws on transport errors.
    bool set_if_absent(const std::string& key, std::chrono::milliseconds ttl);

    // SET PX, overwriting any previous value and lifetime.
    void set_with_ttl(const std::string& key, std::chrono::milliseconds ttl);

    bool exists(const std::string& key);

    // Fixed-window counter implemented as a Lua script (INCR + EXPIRE on first hit).
    RateLimitResult fixed_window(const std::string& key, int limit, int window_sec);

    // Number of keys under this manager's prefix (SCAN based, diagnostics only).
    size_t count_keys(const std::string& sub_prefix);

    const std::string& prefix() const { return prefix_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
    std::string prefix_;
};

/**
 * Replay cache stored in Redis so that every edge instance sees every nonce.
 * Backend failures fail closed: the key is reported as already used.
 */
class RedisReplayCache : public ReplayCache {
public:
    RedisReplayCache(RedisManager& redis, std::chrono::seconds default_ttl);

    bool seen(const std::string& key) override;
    void mark(const std::string& key, std::chrono::seconds ttl) override;
    bool check_and_mark(const std::string& key, std::chrono::seconds ttl) override;
    size_t size() const override;

    using ReplayCache::mark;
    using ReplayCache::check_and_mark;

private:
    RedisManager& redis_;
};

// Rate counters stored in Redis. Backend failures fail open.
class RedisRateLimiter : public RateLimiter {
public:
    RedisRateLimiter(RedisManager& redis, int limit, std::chrono::seconds window = DEFAULT_WINDOW);

    RateLimitResult check(const std::string& identity) override;
    size_t size() const override;

private:
    RedisManager& redis_;
};

}
