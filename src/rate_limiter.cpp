#include "rate_limiter.hpp"
#include "metrics.hpp"

namespace powshield {

MemoryRateLimiter::MemoryRateLimiter(int limit, size_t capacity, std::chrono::seconds window, Clock clock)
    : RateLimiter(limit, window)
    , capacity_(capacity == 0 ? 1 : capacity)
    , clock_(std::move(clock))
{}

RateLimitResult MemoryRateLimiter::check(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    const long long ceiling = limit();

    auto it = index_.find(identity);
    if (it != index_.end() && now - it->second->window_start >= window()) {
        // Window elapsed: the counter starts over.
        lru_.erase(it->second);
        index_.erase(it);
        it = index_.end();
    }

    if (it == index_.end()) {
        if (ceiling <= 0) {
            return {false, 0, ceiling, window().count()};
        }
        while (index_.size() >= capacity_ && !lru_.empty()) {
            index_.erase(lru_.back().identity);
            lru_.pop_back();
        }
        lru_.push_front(Counter{identity, 1, now});
        index_[identity] = lru_.begin();
        return {true, 1, ceiling, 0};
    }

    lru_.splice(lru_.begin(), lru_, it->second);
    Counter& counter = *it->second;

    if (counter.count >= ceiling) {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
            counter.window_start + window() - now);
        long long retry_after = remaining.count();
        if (retry_after < 1) retry_after = 1;
        return {false, counter.count, ceiling, retry_after};
    }

    ++counter.count;
    return {true, counter.count, ceiling, 0};
}

void MemoryRateLimiter::purge_expired() {
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        for (auto it = lru_.begin(); it != lru_.end();) {
            if (now - it->window_start >= window()) {
                index_.erase(it->identity);
                it = lru_.erase(it);
            } else {
                ++it;
            }
        }
        remaining = index_.size();
    }
    MetricsRegistry::instance().set_gauge("rate_limiter_entries", static_cast<double>(remaining));
}

size_t MemoryRateLimiter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

}
