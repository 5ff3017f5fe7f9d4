#pragma once

#include "LocationValidator.hpp"
#include "RateLimiter.hpp"
#include "../ports/ICacheStore.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/ITrackingRepository.hpp"
#include "../ports/IUserDirectory.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../TrackingPoint.hpp"
#include <memory>
#include <optional>

namespace triplog::domain {

// Validate, rate-limit, persist. Address resolution is left to the
// AddressResolutionStage, which picks up the PointStored event published
// here, so a failed lookup can be retried without ingesting again.
// ingest() never throws.
class IngestionPipeline {
public:
    IngestionPipeline(std::shared_ptr<ports::ITrackingRepository> repository,
                      std::shared_ptr<ports::IUserDirectory> directory,
                      std::shared_ptr<ports::ICacheStore> cache,
                      std::shared_ptr<ports::IEventBus> eventBus,
                      std::shared_ptr<IClock> clock,
                      const EngineConfig& config = {});

    IngestResult ingest(const LocationSample& sample, const std::optional<Scope>& scope = std::nullopt);
    IngestResult ingestJson(const std::string& payload, const std::optional<Scope>& scope = std::nullopt);

    static std::string analyticsKey(OwnerId ownerId, TimePoint day);
    static std::string timeframePrefix(OwnerId ownerId);

private:
    IngestResult reject(IngestErrorKind kind, const std::string& message) const;
    IngestResult discard(const std::string& message, const Warning& warning) const;
    void invalidateAnalytics(OwnerId ownerId, TimePoint capturedAt);

    std::shared_ptr<ports::ITrackingRepository> repository_;
    std::shared_ptr<ports::IUserDirectory> directory_;
    std::shared_ptr<ports::ICacheStore> cache_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<IClock> clock_;

    LocationValidator validator_;
    RateLimiter rateLimiter_;
    RateLimitConfig rateLimitConfig_;
};

} // namespace triplog::domain
