#include <gtest/gtest.h>
#include "../core/domain/RateLimiter.hpp"
#include "../core/adapters/InMemoryCacheStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace triplog;

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        cache_ = std::make_shared<adapters::InMemoryCacheStore>(clock_);
        limiter_ = std::make_unique<domain::RateLimiter>(cache_, clock_);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryCacheStore> cache_;
    std::unique_ptr<domain::RateLimiter> limiter_;
};

TEST_F(RateLimiterTest, AllowsTwoPointsPerWindow) {
    auto first = limiter_->checkAndConsume(42);
    auto second = limiter_->checkAndConsume(42);
    auto third = limiter_->checkAndConsume(42);

    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.remaining, 1);
    EXPECT_TRUE(second.allowed);
    EXPECT_EQ(second.remaining, 0);
    EXPECT_FALSE(third.allowed);
    EXPECT_EQ(third.resetAt, first.resetAt);
}

TEST_F(RateLimiterTest, WindowResetsAfterExpiry) {
    limiter_->checkAndConsume(42);
    limiter_->checkAndConsume(42);
    EXPECT_FALSE(limiter_->checkAndConsume(42).allowed);

    clock_->advance(std::chrono::seconds(61));

    auto decision = limiter_->checkAndConsume(42);
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.remaining, 1);
}

TEST_F(RateLimiterTest, OwnersAreCountedSeparately) {
    limiter_->checkAndConsume(1);
    limiter_->checkAndConsume(1);
    EXPECT_FALSE(limiter_->checkAndConsume(1).allowed);
    EXPECT_TRUE(limiter_->checkAndConsume(2).allowed);
}

TEST_F(RateLimiterTest, StateLivesInSharedCache) {
    limiter_->checkAndConsume(7);
    EXPECT_TRUE(cache_->get(domain::RateLimiter::keyFor(7)).has_value());
    EXPECT_EQ(domain::RateLimiter::keyFor(7), "rate_limit:tracking:7");

    // A second limiter over the same cache sees the same window.
    domain::RateLimiter other(cache_, clock_);
    EXPECT_TRUE(other.checkAndConsume(7).allowed);
    EXPECT_FALSE(limiter_->checkAndConsume(7).allowed);
}

TEST_F(RateLimiterTest, FailsOpenWhenCacheIsDown) {
    cache_->setFailing(true);

    auto decision = limiter_->checkAndConsume(42);
    EXPECT_TRUE(decision.allowed);
    EXPECT_TRUE(decision.degraded);

    EXPECT_TRUE(limiter_->checkAndConsume(42).allowed);
    EXPECT_TRUE(limiter_->checkAndConsume(42).allowed);
}

TEST_F(RateLimiterTest, CustomLimitIsHonoured) {
    RateLimitConfig config;
    config.maxPoints = 5;
    config.window = std::chrono::seconds(10);
    domain::RateLimiter limiter(cache_, clock_, config);

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.checkAndConsume(9).allowed);
    }
    EXPECT_FALSE(limiter.checkAndConsume(9).allowed);

    clock_->advance(std::chrono::seconds(10));
    EXPECT_TRUE(limiter.checkAndConsume(9).allowed);
}

TEST_F(RateLimiterTest, ConcurrentRequestsNeverExceedTheCap) {
    RateLimitConfig config;
    config.maxPoints = 5;
    domain::RateLimiter limiter(cache_, clock_, config);

    std::atomic<int> allowed{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 16; ++i) {
        workers.emplace_back([&]() {
            for (int j = 0; j < 4; ++j) {
                if (limiter.checkAndConsume(42).allowed) ++allowed;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(allowed.load(), 5);
    EXPECT_FALSE(limiter.checkAndConsume(42).allowed);
}
