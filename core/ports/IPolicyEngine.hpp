#pragma once

#include <chrono>
#include <cstddef>

namespace triplog::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

// Self-imposed pacing of calls to the external geocoding service.
struct ThrottlePolicy {
    virtual ~ThrottlePolicy() = default;
    virtual size_t getBatchSize() const = 0;
    virtual std::chrono::milliseconds getBatchPause() const = 0;
    virtual int getMaxConsecutiveFailures() const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    virtual const RetryPolicy& getRetryPolicy() const = 0;
    virtual const ThrottlePolicy& getThrottlePolicy() const = 0;
};

} // namespace triplog::ports
