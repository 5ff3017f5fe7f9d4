#include "IngestionPipeline.hpp"
#include "../Geo.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include <cmath>

namespace triplog::domain {

IngestionPipeline::IngestionPipeline(std::shared_ptr<ports::ITrackingRepository> repository,
                                     std::shared_ptr<ports::IUserDirectory> directory,
                                     std::shared_ptr<ports::ICacheStore> cache,
                                     std::shared_ptr<ports::IEventBus> eventBus,
                                     std::shared_ptr<IClock> clock,
                                     const EngineConfig& config)
    : repository_(std::move(repository)),
      directory_(std::move(directory)),
      cache_(cache),
      eventBus_(std::move(eventBus)),
      clock_(clock),
      validator_(config.validation),
      rateLimiter_(cache, clock, config.rateLimit),
      rateLimitConfig_(config.rateLimit) {
}

std::string IngestionPipeline::analyticsKey(OwnerId ownerId, TimePoint day) {
    return "analytics:" + std::to_string(ownerId) + ":" + formatDate(day);
}

std::string IngestionPipeline::timeframePrefix(OwnerId ownerId) {
    return "timeframe:" + std::to_string(ownerId) + ":";
}

IngestResult IngestionPipeline::ingestJson(const std::string& payload, const std::optional<Scope>& scope) {
    LocationSample sample;
    try {
        sample = JsonCodec::parseSample(payload);
    } catch (const std::exception& e) {
        return reject(IngestErrorKind::InvalidInput, e.what());
    }
    return ingest(sample, scope);
}

IngestResult IngestionPipeline::ingest(const LocationSample& sample, const std::optional<Scope>& scope) {
    if (!sample.ownerId) {
        return reject(IngestErrorKind::InvalidInput, "Owner is required");
    }
    if (!sample.lat || !sample.lon) {
        return reject(IngestErrorKind::InvalidInput, "Latitude and longitude are required");
    }

    const OwnerId ownerId = *sample.ownerId;
    const double lat = *sample.lat;
    const double lon = *sample.lon;

    auto outcome = validator_.validate(lat, lon, sample.accuracy);
    switch (outcome.verdict) {
        case Verdict::RejectOutOfRange:
            return reject(IngestErrorKind::InvalidInput, outcome.message);
        case Verdict::RejectVirtual:
        case Verdict::RejectInaccurate:
            Log::debug("Ingest", "Owner " + std::to_string(ownerId) + " " + verdictToString(outcome.verdict) +
                       ": " + outcome.message);
            return discard(outcome.message, *outcome.warning);
        case Verdict::Accept:
            break;
    }

    auto decision = rateLimiter_.checkAndConsume(ownerId);
    if (!decision.allowed) {
        Warning warning;
        warning.type = WarningType::RateLimitExceeded;
        warning.message = "Too many location updates, maximum " + std::to_string(rateLimitConfig_.maxPoints) +
                          " per " + std::to_string(rateLimitConfig_.window.count()) + " seconds";
        warning.details["remaining"] = std::to_string(decision.remaining);
        warning.details["resetAt"] = formatIso8601(decision.resetAt);
        Log::debug("Ingest", "Owner " + std::to_string(ownerId) + " rate limited until " +
                   formatIso8601(decision.resetAt));
        return discard("Rate limit exceeded, location not stored", warning);
    }

    std::optional<ports::OwnerProfile> owner;
    try {
        owner = directory_->findOwner(ownerId);
    } catch (const std::exception& e) {
        return reject(IngestErrorKind::Persistence, std::string("Owner lookup failed: ") + e.what());
    }
    if (!owner) {
        return reject(IngestErrorKind::UnknownOwner, "User with ID " + std::to_string(ownerId) + " not found");
    }

    const TimePoint now = clock_->now();

    TrackingPoint point;
    point.ownerId = ownerId;
    point.lat = lat;
    point.lon = lon;
    point.accuracy = sample.accuracy;
    point.speed = sample.speed;
    point.heading = sample.heading;
    point.altitude = sample.altitude;
    point.altitudeAccuracy = sample.altitudeAccuracy;
    point.receivedAt = now;
    if (sample.timestampMs && std::isfinite(*sample.timestampMs)) {
        point.deviceTimestampMs = static_cast<int64_t>(std::floor(*sample.timestampMs));
        point.capturedAt = fromEpochMillis(point.deviceTimestampMs);
    } else {
        point.deviceTimestampMs = toEpochMillis(now);
        point.capturedAt = now;
    }
    point.rawLocation = Geo::rawLocation(lat, lon);
    point.scope = scope ? *scope : owner->scope;

    TrackingPoint stored;
    try {
        stored = repository_->put(point);
    } catch (const std::exception& e) {
        Log::error("Ingest", "Failed to store location for owner " + std::to_string(ownerId) + ": " + e.what());
        return reject(IngestErrorKind::Persistence, std::string("Failed to store location: ") + e.what());
    }

    invalidateAnalytics(ownerId, stored.capturedAt);

    Event event;
    event.eventType = EventType::PointStored;
    event.ownerId = ownerId;
    event.pointId = stored.id;
    event.timestamp = now;
    eventBus_->publish(event);

    IngestResult result;
    result.stored = true;
    result.message = "Location tracked successfully";
    result.data = stored;
    return result;
}

IngestResult IngestionPipeline::reject(IngestErrorKind kind, const std::string& message) const {
    Log::warn("Ingest", "Rejected sample (" + ingestErrorKindToString(kind) + "): " + message);
    IngestResult result;
    result.stored = false;
    result.message = message;
    result.errorKind = kind;
    result.errorMessage = message;
    return result;
}

IngestResult IngestionPipeline::discard(const std::string& message, const Warning& warning) const {
    IngestResult result;
    result.stored = false;
    result.message = message;
    result.warnings.push_back(warning);
    return result;
}

void IngestionPipeline::invalidateAnalytics(OwnerId ownerId, TimePoint capturedAt) {
    try {
        cache_->remove(analyticsKey(ownerId, capturedAt));
        cache_->removeByPrefix(timeframePrefix(ownerId));
    } catch (const std::exception& e) {
        Log::warn("Ingest", "Could not invalidate analytics cache for owner " + std::to_string(ownerId) +
                  ": " + e.what());
    }
}

} // namespace triplog::domain
