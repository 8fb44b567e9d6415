#pragma once

#include <string>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>

#include "clock.hpp"

namespace powshield {

struct RateLimitResult {
    bool allowed;
    long long current;
    long long limit;
    long long reset_after_sec;
};

// Per-identity admission ceiling over a fixed window.
// check() must count and increment atomically for a given identity.
class RateLimiter {
public:
    static constexpr std::chrono::seconds DEFAULT_WINDOW{60};

    explicit RateLimiter(int limit, std::chrono::seconds window = DEFAULT_WINDOW)
        : limit_(limit), window_(window) {}
    virtual ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Evaluates one admission for the identity.
     * @param identity Caller key, normally the network address.
     * @return allowed=false once the window's ceiling is reached; the count is
     *         only incremented for allowed admissions.
     */
    virtual RateLimitResult check(const std::string& identity) = 0;

    virtual void purge_expired() {}

    virtual size_t size() const = 0;

    bool try_admit(const std::string& identity) { return check(identity).allowed; }

    int limit() const { return limit_; }
    std::chrono::seconds window() const { return window_; }

private:
    int limit_;
    std::chrono::seconds window_;
};

// In-process fixed-window counter. The first admission for an identity opens
// its window; counters beyond capacity are evicted least-recently-used first.
class MemoryRateLimiter : public RateLimiter {
public:
    MemoryRateLimiter(int limit, size_t capacity,
                      std::chrono::seconds window = DEFAULT_WINDOW,
                      Clock clock = system_clock_source());

    RateLimitResult check(const std::string& identity) override;
    void purge_expired() override;
    size_t size() const override;

private:
    using TimePoint = std::chrono::system_clock::time_point;

    struct Counter {
        std::string identity;
        long long count;
        TimePoint window_start;
    };

    size_t capacity_;
    Clock clock_;
    std::list<Counter> lru_;  // front = most recently touched
    std::unordered_map<std::string, std::list<Counter>::iterator> index_;
    mutable std::mutex mutex_;
};

}
