#pragma once

#include "AnalyticsAggregator.hpp"
#include "GeocodeResolver.hpp"
#include "LocationValidator.hpp"
#include "StopDetector.hpp"
#include "TripAnalyzer.hpp"
#include "../ports/ICacheStore.hpp"
#include "../ports/ITrackingRepository.hpp"
#include "../ports/IUserDirectory.hpp"
#include "../Analytics.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../Timeframe.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace triplog::domain {

struct ReportResult {
    bool success = false;
    std::string message;
    nlohmann::json data;
    bool fromCache = false;
};

struct StopEventInput {
    double lat = 0.0;
    double lon = 0.0;
    TimePoint startTime;
    TimePoint endTime;
    std::optional<std::string> address;
};

// Read-only analytics feed plus the administrative operations on stored
// points. Every public call returns a ReportResult and never throws.
class TrackingService {
public:
    TrackingService(std::shared_ptr<ports::ITrackingRepository> repository,
                    std::shared_ptr<ports::IUserDirectory> directory,
                    std::shared_ptr<ports::ICacheStore> cache,
                    std::shared_ptr<GeocodeResolver> resolver,
                    std::shared_ptr<IClock> clock,
                    const EngineConfig& config = {});

    ReportResult getTrackingReport(OwnerId ownerId, const TrackingQuery& query);
    ReportResult getTrackingForUsers(const std::vector<OwnerId>& ownerIds, const TrackingQuery& query);
    ReportResult getDailyTracking(OwnerId ownerId, TimePoint day);
    ReportResult recalculateDay(OwnerId ownerId, TimePoint day);
    ReportResult bulkBackfill(std::optional<OwnerId> ownerId = std::nullopt, size_t limit = 0);

    ReportResult getPoint(PointId id);
    ReportResult getOwnerPoints(OwnerId ownerId);
    ReportResult removePoint(PointId id, OwnerId deletedBy);
    ReportResult restorePoint(PointId id);
    ReportResult recordStop(OwnerId ownerId, const StopEventInput& input);

    // Runs backfill and every analysis over the owner's points in the period.
    // Throws on repository faults.
    TrackingReport computeReport(const ports::OwnerProfile& owner,
                                 Timeframe timeframe,
                                 const Period& period,
                                 const Scope& scope);

    static std::string timeframeKey(OwnerId ownerId, const TrackingQuery& query, const Period& period);

private:
    void invalidateOwner(OwnerId ownerId);
    std::optional<nlohmann::json> readCache(const std::string& key);
    void writeCache(const std::string& key, const nlohmann::json& value);
    static ReportResult failure(const std::string& message);

    std::shared_ptr<ports::ITrackingRepository> repository_;
    std::shared_ptr<ports::IUserDirectory> directory_;
    std::shared_ptr<ports::ICacheStore> cache_;
    std::shared_ptr<GeocodeResolver> resolver_;
    std::shared_ptr<IClock> clock_;
    EngineConfig config_;

    LocationValidator validator_;
    TripAnalyzer tripAnalyzer_;
    StopDetector stopDetector_;
    AnalyticsAggregator aggregator_;
};

} // namespace triplog::domain
