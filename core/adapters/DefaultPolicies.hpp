#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../EngineConfig.hpp"
#include <algorithm>

namespace triplog::adapters {

// attempt x baseDelay, i.e. 1 s, 2 s, 3 s with the default base.
class LinearBackoffRetryPolicy : public ports::RetryPolicy {
public:
    LinearBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                             int maxAttempts = 3,
                             std::chrono::milliseconds maxDelay = std::chrono::seconds(30))
        : baseDelay_(baseDelay), maxAttempts_(maxAttempts), maxDelay_(maxDelay) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        auto delay = baseDelay_ * std::max(attemptCount, 1);
        return std::min(delay, maxDelay_);
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

private:
    std::chrono::milliseconds baseDelay_;
    int maxAttempts_;
    std::chrono::milliseconds maxDelay_;
};

class FixedBatchThrottlePolicy : public ports::ThrottlePolicy {
public:
    FixedBatchThrottlePolicy(size_t batchSize = 5,
                             std::chrono::milliseconds batchPause = std::chrono::milliseconds(1000),
                             int maxConsecutiveFailures = 3)
        : batchSize_(std::max<size_t>(batchSize, 1)),
          batchPause_(batchPause),
          maxConsecutiveFailures_(std::max(maxConsecutiveFailures, 1)) {}

    size_t getBatchSize() const override {
        return batchSize_;
    }

    std::chrono::milliseconds getBatchPause() const override {
        return batchPause_;
    }

    int getMaxConsecutiveFailures() const override {
        return maxConsecutiveFailures_;
    }

private:
    size_t batchSize_;
    std::chrono::milliseconds batchPause_;
    int maxConsecutiveFailures_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine() = default;

    explicit DefaultPolicyEngine(const GeocodingConfig& config)
        : retryPolicy_(config.retryBaseDelay, config.maxAttempts),
          throttlePolicy_(config.batchSize, config.batchPause, config.maxConsecutiveFailures) {}

    const ports::RetryPolicy& getRetryPolicy() const override {
        return retryPolicy_;
    }

    const ports::ThrottlePolicy& getThrottlePolicy() const override {
        return throttlePolicy_;
    }

private:
    LinearBackoffRetryPolicy retryPolicy_;
    FixedBatchThrottlePolicy throttlePolicy_;
};

} // namespace triplog::adapters
