#include <gtest/gtest.h>
#include "resilience/retry_policy.h"
#include <stdexcept>
#include <vector>

using namespace meshcore;
using namespace std::chrono_literals;

TEST(RetryPolicyTest, DefaultBackoffDoubles) {
    RetryPolicy policy;

    EXPECT_EQ(0ms, policy.calculateDelay(0));
    EXPECT_EQ(100ms, policy.calculateDelay(1));
    EXPECT_EQ(200ms, policy.calculateDelay(2));
    EXPECT_EQ(400ms, policy.calculateDelay(3));
}

TEST(RetryPolicyTest, DelayIsCapped) {
    RetryConfig config;
    config.initial_delay = 1000ms;
    config.max_delay = 3000ms;
    RetryPolicy policy(config);

    EXPECT_EQ(2000ms, policy.calculateDelay(2));
    EXPECT_EQ(3000ms, policy.calculateDelay(3));
    EXPECT_EQ(3000ms, policy.calculateDelay(10));
}

TEST(RetryPolicyTest, ShouldRetryUpToMaxRetries) {
    RetryConfig config;
    config.max_retries = 2;
    RetryPolicy policy(config);

    EXPECT_FALSE(policy.shouldRetry(0));
    EXPECT_TRUE(policy.shouldRetry(1));
    EXPECT_TRUE(policy.shouldRetry(2));
    EXPECT_FALSE(policy.shouldRetry(3));
}

TEST(RetryPolicyTest, InvalidConfigRejected) {
    RetryConfig config;
    config.backoff_multiplier = 0.5;
    EXPECT_THROW(RetryPolicy{config}, std::invalid_argument);

    config.backoff_multiplier = 2.0;
    config.initial_delay = -1ms;
    EXPECT_THROW(RetryPolicy{config}, std::invalid_argument);
}

TEST(RetryPolicyTest, BackoffUsesSleepFunction) {
    RetryPolicy policy;
    std::vector<std::chrono::milliseconds> slept;
    std::vector<uint32_t> attempts;
    policy.setSleepFunction([&](std::chrono::milliseconds d) { slept.push_back(d); });
    policy.setDelayCallback([&](uint32_t attempt, std::chrono::milliseconds) { attempts.push_back(attempt); });

    policy.backoff(1);
    policy.backoff(2);

    EXPECT_EQ((std::vector<std::chrono::milliseconds>{100ms, 200ms}), slept);
    EXPECT_EQ((std::vector<uint32_t>{1, 2}), attempts);
}

TEST(RetryPolicyTest, TransientStatuses) {
    for (int status : {408, 429, 500, 502, 503, 504}) {
        EXPECT_TRUE(RetryPolicy::isTransientStatus(status)) << status;
    }
    for (int status : {200, 400, 401, 404, 409, 501}) {
        EXPECT_FALSE(RetryPolicy::isTransientStatus(status)) << status;
    }
}
