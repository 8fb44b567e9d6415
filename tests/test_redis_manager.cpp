#include <gtest/gtest.h>
#include "redis_manager.hpp"
#include "hasher.hpp"
#include <thread>
#include <chrono>

using namespace powshield;

class RedisManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique prefix per run so leftovers from earlier runs never interfere.
        redis = std::make_unique<RedisManager>("tcp://127.0.0.1:6379?socket_timeout=100ms",
                                               "powshield_test:" + Hasher::random_token().substr(0, 8) + ":");
    }

    std::unique_ptr<RedisManager> redis;
};

TEST_F(RedisManagerTest, ConnectionStatus) {
    if (!redis->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(redis->is_connected());
}

TEST_F(RedisManagerTest, SetIfAbsent) {
    if (!redis->is_connected()) GTEST_SKIP();

    EXPECT_TRUE(redis->set_if_absent("k", std::chrono::milliseconds(5000)));
    EXPECT_FALSE(redis->set_if_absent("k", std::chrono::milliseconds(5000)));
    EXPECT_TRUE(redis->exists("k"));
}

TEST_F(RedisManagerTest, KeysExpire) {
    if (!redis->is_connected()) GTEST_SKIP();

    redis->set_with_ttl("short", std::chrono::milliseconds(100));
    EXPECT_TRUE(redis->exists("short"));
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_FALSE(redis->exists("short"));
}

TEST_F(RedisManagerTest, ReplayCache) {
    if (!redis->is_connected()) GTEST_SKIP();

    RedisReplayCache cache(*redis, std::chrono::seconds(30));
    EXPECT_FALSE(cache.seen("1700000000:abc"));
    EXPECT_TRUE(cache.check_and_mark("1700000000:abc"));
    EXPECT_TRUE(cache.seen("1700000000:abc"));
    EXPECT_FALSE(cache.check_and_mark("1700000000:abc"));
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(RedisManagerTest, LuaRateLimiter) {
    if (!redis->is_connected()) GTEST_SKIP();

    RedisRateLimiter limiter(*redis, 2, std::chrono::seconds(10));
    
    auto r1 = limiter.check("rl_test_user");
    EXPECT_TRUE(r1.allowed);
    EXPECT_EQ(r1.current, 1);
    
    auto r2 = limiter.check("rl_test_user");
    EXPECT_TRUE(r2.allowed);
    
    auto r3 = limiter.check("rl_test_user");
    EXPECT_FALSE(r3.allowed);
    EXPECT_EQ(r3.current, 2);
    EXPECT_GE(r3.reset_after_sec, 1);

    EXPECT_TRUE(limiter.try_admit("other_user"));
}

// No Redis listens on port 1: replay checks must refuse, rate limiting must admit.
TEST(RedisUnavailableTest, FailureModes) {
    RedisManager redis("tcp://127.0.0.1:1?connect_timeout=100ms");
    ASSERT_FALSE(redis.is_connected());
    EXPECT_THROW(redis.exists("k"), std::runtime_error);

    RedisReplayCache cache(redis, std::chrono::seconds(30));
    EXPECT_TRUE(cache.seen("1700000000:abc"));
    EXPECT_FALSE(cache.check_and_mark("1700000000:abc"));
    EXPECT_EQ(cache.size(), 0u);

    RedisRateLimiter limiter(redis, 1);
    EXPECT_TRUE(limiter.try_admit("1.2.3.4"));
    EXPECT_TRUE(limiter.try_admit("1.2.3.4"));
}
