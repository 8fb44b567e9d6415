#include "redis_manager.hpp"
#include "security_logger.hpp"
#include <iostream>
#include <iterator>
#include <vector>

namespace powshield {

RedisManager::RedisManager(const std::string& redis_url, const std::string& key_prefix)
    : prefix_(key_prefix) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
        redis_->ping();
        connected_ = true;
        std::cout << "[*] Redis connected: " << redis_url << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis connection failed: " << e.what() << "\n";
        connected_ = false;
    }
}

bool RedisManager::set_if_absent(const std::string& key, std::chrono::milliseconds ttl) {
    if (!connected_) throw std::runtime_error("Redis not connected");
    return redis_->set(prefix_ + key, "1", ttl, sw::redis::UpdateType::NOT_EXIST);
}

void RedisManager::set_with_ttl(const std::string& key, std::chrono::milliseconds ttl) {
    if (!connected_) throw std::runtime_error("Redis not connected");
    redis_->set(prefix_ + key, "1", ttl);
}

bool RedisManager::exists(const std::string& key) {
    if (!connected_) throw std::runtime_error("Redis not connected");
    return redis_->exists(prefix_ + key) > 0;
}

// Fixed window: the first INCR of a window sets its expiry, later hits share it.
// Denied requests do not increment the counter.
RateLimitResult RedisManager::fixed_window(const std::string& key, int limit, int window_sec) {
    if (!connected_) throw std::runtime_error("Redis not connected");

    static const std::string script = R"(
        local key = KEYS[1]
        local limit = tonumber(ARGV[1])
        local window = tonumber(ARGV[2])

        local current = tonumber(redis.call('GET', key) or '0')
        if current >= limit then
            local ttl = redis.call('TTL', key)
            if ttl < 1 then ttl = 1 end
            return {0, current, ttl}
        end

        local count = redis.call('INCR', key)
        if count == 1 then
            redis.call('EXPIRE', key, window)
        end
        return {1, count, 0}
    )";

    std::vector<std::string> keys = {prefix_ + key};
    std::vector<std::string> args = {std::to_string(limit), std::to_string(window_sec)};
    std::vector<long long> res;
    redis_->eval(script, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));

    RateLimitResult result = {true, 0, static_cast<long long>(limit), 0};
    if (res.size() >= 3) {
        result.allowed = res[0] == 1;
        result.current = res[1];
        result.reset_after_sec = res[2];
    }
    return result;
}

size_t RedisManager::count_keys(const std::string& sub_prefix) {
    if (!connected_) return 0;
    size_t total = 0;
    try {
        long long cursor = 0;
        std::string pattern = prefix_ + sub_prefix + "*";
        do {
            std::vector<std::string> batch;
            cursor = redis_->scan(cursor, pattern, 500, std::back_inserter(batch));
            total += batch.size();
        } while (cursor != 0);
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis scan failed: " << e.what() << "\n";
    }
    return total;
}

RedisReplayCache::RedisReplayCache(RedisManager& redis, std::chrono::seconds default_ttl)
    : ReplayCache(default_ttl), redis_(redis)
{}

bool RedisReplayCache::seen(const std::string& key) {
    try {
        return redis_.exists("replay:" + key);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::BACKEND_ERROR,
                            "internal", std::string("Replay lookup failed: ") + e.what());
        return true;
    }
}

void RedisReplayCache::mark(const std::string& key, std::chrono::seconds ttl) {
    try {
        redis_.set_with_ttl("replay:" + key, ttl);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::BACKEND_ERROR,
                            "internal", std::string("Replay mark failed: ") + e.what());
    }
}

bool RedisReplayCache::check_and_mark(const std::string& key, std::chrono::seconds ttl) {
    try {
        return redis_.set_if_absent("replay:" + key, ttl);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::BACKEND_ERROR,
                            "internal", std::string("Replay check-and-mark failed: ") + e.what());
        return false;
    }
}

size_t RedisReplayCache::size() const {
    return redis_.count_keys("replay:");
}

RedisRateLimiter::RedisRateLimiter(RedisManager& redis, int limit, std::chrono::seconds window)
    : RateLimiter(limit, window), redis_(redis)
{}

RateLimitResult RedisRateLimiter::check(const std::string& identity) {
    try {
        return redis_.fixed_window("rate:" + identity, limit(), static_cast<int>(window().count()));
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::BACKEND_ERROR,
                            identity, std::string("Rate limit check failed, admitting: ") + e.what());
        return {true, 0, static_cast<long long>(limit()), 0};
    }
}

size_t RedisRateLimiter::size() const {
    return redis_.count_keys("rate:");
}

}
