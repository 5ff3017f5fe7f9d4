#include "RateLimiter.hpp"
#include "../Log.hpp"
#include <nlohmann/json.hpp>

namespace triplog::domain {

RateLimiter::RateLimiter(std::shared_ptr<ports::ICacheStore> cache,
                         std::shared_ptr<IClock> clock,
                         RateLimitConfig config)
    : cache_(std::move(cache)), clock_(std::move(clock)), config_(config) {
}

std::string RateLimiter::keyFor(OwnerId ownerId) {
    return "rate_limit:tracking:" + std::to_string(ownerId);
}

RateLimitDecision RateLimiter::checkAndConsume(OwnerId ownerId) {
    const TimePoint now = clock_->now();
    const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(config_.window);

    RateLimitDecision decision;
    try {
        cache_->compute(keyFor(ownerId), [&](const std::optional<std::string>& current)
                                             -> std::optional<ports::CacheWrite> {
            int count = 0;
            int64_t resetAtMs = 0;
            if (current) {
                auto state = nlohmann::json::parse(*current, nullptr, false);
                if (!state.is_discarded() && state.is_object()) {
                    count = state.value("count", 0);
                    resetAtMs = state.value("resetAt", int64_t{0});
                }
            }

            if (!current || count <= 0 || toEpochMillis(now) >= resetAtMs) {
                TimePoint resetAt = now + window;
                decision.allowed = true;
                decision.remaining = config_.maxPoints - 1;
                decision.resetAt = resetAt;
                nlohmann::json state = {{"count", 1}, {"resetAt", toEpochMillis(resetAt)}};
                return ports::CacheWrite{state.dump(), window};
            }

            decision.resetAt = fromEpochMillis(resetAtMs);
            if (count >= config_.maxPoints) {
                decision.allowed = false;
                decision.remaining = 0;
                return std::nullopt;
            }

            decision.allowed = true;
            decision.remaining = config_.maxPoints - (count + 1);
            nlohmann::json state = {{"count", count + 1}, {"resetAt", resetAtMs}};
            auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(decision.resetAt - now);
            return ports::CacheWrite{state.dump(), ttl};
        });
    } catch (const std::exception& e) {
        Log::error("RateLimiter", "Rate limit check failed for owner " + std::to_string(ownerId) +
                   ", allowing request: " + e.what());
        decision = RateLimitDecision{};
        decision.allowed = true;
        decision.remaining = config_.maxPoints;
        decision.resetAt = now + window;
        decision.degraded = true;
    }

    return decision;
}

} // namespace triplog::domain
