#pragma once

#include "../ports/ICacheStore.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../TrackingPoint.hpp"
#include <memory>

namespace triplog::domain {

struct RateLimitDecision {
    bool allowed = true;
    int remaining = 0;
    TimePoint resetAt;
    bool degraded = false;   // store failed, request let through
};

// Fixed-window counter per owner, kept in the shared cache as {count, resetAt}.
class RateLimiter {
public:
    RateLimiter(std::shared_ptr<ports::ICacheStore> cache,
                std::shared_ptr<IClock> clock,
                RateLimitConfig config = {});

    RateLimitDecision checkAndConsume(OwnerId ownerId);

    static std::string keyFor(OwnerId ownerId);

private:
    std::shared_ptr<ports::ICacheStore> cache_;
    std::shared_ptr<IClock> clock_;
    RateLimitConfig config_;
};

} // namespace triplog::domain
