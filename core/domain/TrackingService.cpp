#include "TrackingService.hpp"
#include "IngestionPipeline.hpp"
#include "../Geo.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <map>

namespace triplog::domain {

TrackingService::TrackingService(std::shared_ptr<ports::ITrackingRepository> repository,
                                 std::shared_ptr<ports::IUserDirectory> directory,
                                 std::shared_ptr<ports::ICacheStore> cache,
                                 std::shared_ptr<GeocodeResolver> resolver,
                                 std::shared_ptr<IClock> clock,
                                 const EngineConfig& config)
    : repository_(std::move(repository)),
      directory_(std::move(directory)),
      cache_(std::move(cache)),
      resolver_(std::move(resolver)),
      clock_(std::move(clock)),
      config_(config),
      validator_(config.validation),
      tripAnalyzer_(config.trip, config.validation),
      stopDetector_(config.stops, config.validation),
      aggregator_(config.analytics, config.trip) {
}

std::string TrackingService::timeframeKey(OwnerId ownerId, const TrackingQuery& query, const Period& period) {
    std::string key = IngestionPipeline::timeframePrefix(ownerId) + timeframeToString(query.timeframe) + ":" +
                      std::to_string(toEpochMillis(period.start)) + ":" +
                      std::to_string(toEpochMillis(period.end));
    key += ":" + (query.scope.organizationId ? std::to_string(*query.scope.organizationId) : std::string("-"));
    key += ":" + (query.scope.branchId ? std::to_string(*query.scope.branchId) : std::string("-"));
    return key;
}

ReportResult TrackingService::failure(const std::string& message) {
    ReportResult result;
    result.success = false;
    result.message = message;
    return result;
}

std::optional<nlohmann::json> TrackingService::readCache(const std::string& key) {
    try {
        auto cached = cache_->get(key);
        if (!cached) return std::nullopt;
        auto parsed = nlohmann::json::parse(*cached, nullptr, false);
        if (parsed.is_discarded()) return std::nullopt;
        return parsed;
    } catch (const std::exception& e) {
        Log::warn("Tracking", "Cache read failed for " + key + ": " + e.what());
        return std::nullopt;
    }
}

void TrackingService::writeCache(const std::string& key, const nlohmann::json& value) {
    try {
        cache_->set(key, value.dump(),
                    std::chrono::duration_cast<std::chrono::milliseconds>(config_.analytics.reportCacheTtl));
    } catch (const std::exception& e) {
        Log::warn("Tracking", "Cache write failed for " + key + ": " + e.what());
    }
}

void TrackingService::invalidateOwner(OwnerId ownerId) {
    try {
        cache_->removeByPrefix("analytics:" + std::to_string(ownerId) + ":");
        cache_->removeByPrefix(IngestionPipeline::timeframePrefix(ownerId));
    } catch (const std::exception& e) {
        Log::warn("Tracking", "Could not invalidate cache for owner " + std::to_string(ownerId) + ": " + e.what());
    }
}

TrackingReport TrackingService::computeReport(const ports::OwnerProfile& owner,
                                              Timeframe timeframe,
                                              const Period& period,
                                              const Scope& scope) {
    ports::RangeQuery range;
    range.ownerId = owner.id;
    range.start = period.start;
    range.end = period.end;
    range.scope = scope;

    auto stored = repository_->queryByTimeRange(range);

    std::vector<TrackingPoint> points;
    points.reserve(stored.size());
    for (auto& point : stored) {
        if (!validator_.isVirtual(point.lat, point.lon)) {
            points.push_back(std::move(point));
        }
    }

    TrackingReport report;
    report.owner = owner;
    report.timeframe = timeframe;
    report.period = period;

    auto backfill = resolver_->backfill(points, repository_.get());
    report.points = std::move(backfill.points);
    report.backfill = backfill.summary;

    for (const auto& point : report.points) {
        if (point.hasAddress()) {
            ++report.geocoding.successful;
        } else {
            ++report.geocoding.usedFallback;
            if (point.addressError) ++report.geocoding.failed;
        }
    }

    report.analytics = aggregator_.pointAnalytics(report.points);
    report.segments = aggregator_.tripSegments(report.points);
    report.trip = tripAnalyzer_.analyze(report.points);
    report.stops = stopDetector_.detectStops(report.points);
    report.insights = aggregator_.insights(report.points, report.trip, report.stops);
    return report;
}

ReportResult TrackingService::getTrackingReport(OwnerId ownerId, const TrackingQuery& query) {
    try {
        auto owner = directory_->findOwner(ownerId);
        if (!owner) {
            return failure("User with ID " + std::to_string(ownerId) + " not found");
        }

        Period period = resolvePeriod(query, clock_->now());
        const std::string key = timeframeKey(ownerId, query, period);

        if (auto cached = readCache(key)) {
            ReportResult result;
            result.success = true;
            result.message = "Tracking data retrieved from cache";
            result.data = *cached;
            result.fromCache = true;
            return result;
        }

        auto report = computeReport(*owner, query.timeframe, period, query.scope);
        ReportResult result;
        result.success = true;
        result.message = "Tracking data retrieved successfully";
        result.data = JsonCodec::reportToJson(report);
        writeCache(key, result.data);
        return result;
    } catch (const std::invalid_argument& e) {
        return failure(e.what());
    } catch (const std::exception& e) {
        Log::error("Tracking", "Report for owner " + std::to_string(ownerId) + " failed: " + e.what());
        return failure(std::string("Failed to get tracking data: ") + e.what());
    }
}

ReportResult TrackingService::getTrackingForUsers(const std::vector<OwnerId>& ownerIds, const TrackingQuery& query) {
    if (ownerIds.empty()) {
        return failure("At least one user ID is required");
    }
    if (ownerIds.size() > config_.analytics.maxUsersPerReport) {
        return failure("Cannot process more than " + std::to_string(config_.analytics.maxUsersPerReport) +
                       " users at once");
    }

    Period period;
    try {
        period = resolvePeriod(query, clock_->now());
    } catch (const std::invalid_argument& e) {
        return failure(e.what());
    }

    struct UserOutcome {
        OwnerId id = 0;
        std::optional<TrackingReport> report;
        std::string error;
    };

    auto runOne = [this, &query, &period](OwnerId id) {
        UserOutcome outcome;
        outcome.id = id;
        try {
            auto owner = directory_->findOwner(id);
            if (!owner) {
                outcome.error = "User with ID " + std::to_string(id) + " not found";
                return outcome;
            }
            outcome.report = computeReport(*owner, query.timeframe, period, query.scope);
        } catch (const std::exception& e) {
            outcome.error = e.what();
        }
        return outcome;
    };

    std::vector<UserOutcome> outcomes;
    const size_t chunk = std::max<size_t>(config_.analytics.userReportConcurrency, 1);
    for (size_t begin = 0; begin < ownerIds.size(); begin += chunk) {
        size_t end = std::min(begin + chunk, ownerIds.size());
        std::vector<std::future<UserOutcome>> inFlight;
        for (size_t i = begin; i < end; ++i) {
            inFlight.push_back(std::async(std::launch::async, runOne, ownerIds[i]));
        }
        for (auto& future : inFlight) {
            outcomes.push_back(future.get());
        }
    }

    nlohmann::json users = nlohmann::json::array();
    nlohmann::json errors = nlohmann::json::array();
    double totalDistance = 0.0;
    size_t totalPoints = 0;
    const UserOutcome* most = nullptr;
    const UserOutcome* least = nullptr;

    for (const auto& outcome : outcomes) {
        if (!outcome.report) {
            errors.push_back({{"userId", outcome.id}, {"error", outcome.error}});
            continue;
        }
        users.push_back(JsonCodec::reportToJson(*outcome.report));
        totalDistance += outcome.report->trip.totalDistanceKm;
        totalPoints += outcome.report->points.size();

        size_t count = outcome.report->points.size();
        if (!most || count > most->report->points.size()) most = &outcome;
        if (!least || count < least->report->points.size()) least = &outcome;
    }

    auto activity = [](const UserOutcome* outcome) -> nlohmann::json {
        if (!outcome) return nullptr;
        return {
            {"id", outcome->id},
            {"name", outcome->report->owner.name},
            {"points", outcome->report->points.size()}
        };
    };

    size_t succeeded = users.size();
    ReportResult result;
    result.success = true;
    result.message = "Tracking data retrieved for " + std::to_string(succeeded) + " of " +
                     std::to_string(ownerIds.size()) + " users";
    result.data = {
        {"timeframe", timeframeToString(query.timeframe)},
        {"period", JsonCodec::periodToJson(period)},
        {"totalUsers", ownerIds.size()},
        {"successfulUsers", succeeded},
        {"users", users},
        {"errors", errors},
        {"organizationSummary", {
            {"totalDistance", JsonCodec::round2(totalDistance)},
            {"averagePointsPerUser", succeeded > 0 ? JsonCodec::roundWhole(
                static_cast<double>(totalPoints) / static_cast<double>(succeeded)) : 0},
            {"mostActiveUser", activity(most)},
            {"leastActiveUser", activity(least)}
        }}
    };
    return result;
}

ReportResult TrackingService::getDailyTracking(OwnerId ownerId, TimePoint day) {
    try {
        auto owner = directory_->findOwner(ownerId);
        if (!owner) {
            return failure("User with ID " + std::to_string(ownerId) + " not found");
        }

        const std::string key = IngestionPipeline::analyticsKey(ownerId, day);
        if (auto cached = readCache(key)) {
            ReportResult result;
            result.success = true;
            result.message = "Daily tracking retrieved from cache";
            result.data = *cached;
            result.fromCache = true;
            return result;
        }

        auto report = computeReport(*owner, Timeframe::Custom, dayPeriod(day), Scope{});
        ReportResult result;
        result.success = true;
        result.message = "Daily tracking retrieved successfully";
        result.data = JsonCodec::reportToJson(report);
        result.data["date"] = formatDate(day);
        writeCache(key, result.data);
        return result;
    } catch (const std::exception& e) {
        Log::error("Tracking", "Daily report for owner " + std::to_string(ownerId) + " failed: " + e.what());
        return failure(std::string("Failed to get daily tracking: ") + e.what());
    }
}

ReportResult TrackingService::recalculateDay(OwnerId ownerId, TimePoint day) {
    try {
        auto owner = directory_->findOwner(ownerId);
        if (!owner) {
            return failure("User with ID " + std::to_string(ownerId) + " not found");
        }

        invalidateOwner(ownerId);

        Period period = dayPeriod(day);
        ports::RangeQuery range;
        range.ownerId = ownerId;
        range.start = period.start;
        range.end = period.end;
        size_t original = repository_->queryByTimeRange(range).size();

        auto report = computeReport(*owner, Timeframe::Custom, period, Scope{});

        RecalculationInfo info;
        info.originalPoints = original;
        info.filteredPoints = report.points.size();
        info.removedVirtualPoints = original - report.points.size();
        info.recalculatedAt = clock_->now();
        report.recalculation = info;

        ReportResult result;
        result.success = true;
        result.message = "Tracking data recalculated for " + formatDate(day);
        result.data = JsonCodec::reportToJson(report);
        result.data["date"] = formatDate(day);
        writeCache(IngestionPipeline::analyticsKey(ownerId, day), result.data);

        Log::info("Tracking", "Recalculated " + formatDate(day) + " for owner " + std::to_string(ownerId) +
                  ": " + std::to_string(info.removedVirtualPoints) + " virtual points excluded");
        return result;
    } catch (const std::exception& e) {
        Log::error("Tracking", "Recalculation for owner " + std::to_string(ownerId) + " failed: " + e.what());
        return failure(std::string("Failed to recalculate tracking data: ") + e.what());
    }
}

ReportResult TrackingService::bulkBackfill(std::optional<OwnerId> ownerId, size_t limit) {
    try {
        size_t effectiveLimit = limit > 0 ? limit : config_.geocoding.bulkLimit;
        auto unresolved = repository_->findUnresolved(ownerId, effectiveLimit);

        std::map<OwnerId, std::vector<TrackingPoint>> byOwner;
        for (auto& point : unresolved) {
            byOwner[point.ownerId].push_back(std::move(point));
        }

        BackfillSummary total;
        for (auto& [owner, points] : byOwner) {
            std::stable_sort(points.begin(), points.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
                return a.capturedAt < b.capturedAt;
            });

            auto result = resolver_->backfill(points, repository_.get());
            const auto& s = result.summary;
            total.candidates += s.candidates;
            total.groups += s.groups;
            total.groupsResolved += s.groupsResolved;
            total.groupsFailed += s.groupsFailed;
            total.groupsSkipped += s.groupsSkipped;
            total.resolvedPoints += s.resolvedPoints;
            total.failedPoints += s.failedPoints;
            total.skippedPoints += s.skippedPoints;
            total.deferredPoints += s.deferredPoints;
            total.externalCalls += s.externalCalls;
            total.circuitOpen = total.circuitOpen || s.circuitOpen;

            if (s.resolvedPoints > 0) {
                invalidateOwner(owner);
            }
        }

        ReportResult result;
        result.success = true;
        result.message = "Processed " + std::to_string(unresolved.size()) + " tracking points";
        result.data = {
            {"processed", total.candidates},
            {"successful", total.resolvedPoints},
            {"failed", total.failedPoints},
            {"skipped", total.skippedPoints + total.deferredPoints},
            {"summary", JsonCodec::backfillSummaryToJson(total)}
        };
        return result;
    } catch (const std::exception& e) {
        Log::error("Tracking", std::string("Bulk backfill failed: ") + e.what());
        return failure(std::string("Bulk geocoding failed: ") + e.what());
    }
}

ReportResult TrackingService::getPoint(PointId id) {
    try {
        auto point = repository_->get(id);
        if (!point || point->isDeleted()) {
            return failure("Tracking point " + std::to_string(id) + " not found");
        }
        ReportResult result;
        result.success = true;
        result.message = "Tracking point retrieved";
        result.data = JsonCodec::pointToJson(*point);
        return result;
    } catch (const std::exception& e) {
        return failure(std::string("Failed to load tracking point: ") + e.what());
    }
}

ReportResult TrackingService::getOwnerPoints(OwnerId ownerId) {
    try {
        if (!directory_->findOwner(ownerId)) {
            return failure("User with ID " + std::to_string(ownerId) + " not found");
        }

        nlohmann::json points = nlohmann::json::array();
        for (const auto& point : repository_->findByOwner(ownerId)) {
            points.push_back(JsonCodec::pointToJson(point));
        }

        ReportResult result;
        result.success = true;
        result.message = "Retrieved " + std::to_string(points.size()) + " tracking points";
        result.data = {{"ownerId", ownerId}, {"trackingPoints", points}};
        return result;
    } catch (const std::exception& e) {
        return failure(std::string("Failed to load tracking points: ") + e.what());
    }
}

ReportResult TrackingService::removePoint(PointId id, OwnerId deletedBy) {
    try {
        auto point = repository_->get(id);
        if (!point || !repository_->softDelete(id, deletedBy, clock_->now())) {
            return failure("Tracking point " + std::to_string(id) + " not found or already deleted");
        }
        invalidateOwner(point->ownerId);

        ReportResult result;
        result.success = true;
        result.message = "Tracking point deleted";
        result.data = {{"id", id}, {"deletedBy", deletedBy}};
        return result;
    } catch (const std::exception& e) {
        return failure(std::string("Failed to delete tracking point: ") + e.what());
    }
}

ReportResult TrackingService::restorePoint(PointId id) {
    try {
        auto point = repository_->get(id);
        if (!point || !repository_->restore(id)) {
            return failure("Tracking point " + std::to_string(id) + " not found or not deleted");
        }
        invalidateOwner(point->ownerId);

        ReportResult result;
        result.success = true;
        result.message = "Tracking point restored";
        result.data = {{"id", id}};
        return result;
    } catch (const std::exception& e) {
        return failure(std::string("Failed to restore tracking point: ") + e.what());
    }
}

ReportResult TrackingService::recordStop(OwnerId ownerId, const StopEventInput& input) {
    try {
        auto owner = directory_->findOwner(ownerId);
        if (!owner) {
            return failure("User with ID " + std::to_string(ownerId) + " not found");
        }
        if (!Geo::isValidLatitude(input.lat) || !Geo::isValidLongitude(input.lon)) {
            return failure("Invalid coordinates");
        }
        if (input.endTime < input.startTime) {
            return failure("Stop end time must not be before its start time");
        }

        TrackingPoint point;
        point.ownerId = ownerId;
        point.lat = input.lat;
        point.lon = input.lon;
        point.speed = 0.0;
        point.capturedAt = input.startTime;
        point.receivedAt = clock_->now();
        point.deviceTimestampMs = toEpochMillis(input.startTime);
        point.rawLocation = Geo::rawLocation(input.lat, input.lon);
        point.scope = owner->scope;

        StopMarker marker;
        marker.startTime = input.startTime;
        marker.endTime = input.endTime;
        marker.durationMinutes = static_cast<int64_t>(std::llround(
            std::chrono::duration<double, std::ratio<60>>(input.endTime - input.startTime).count()));
        point.stop = marker;

        if (input.address && !input.address->empty()) {
            point.address = input.address;
        } else {
            auto resolved = resolver_->resolve(input.lat, input.lon);
            if (resolved.ok()) point.address = resolved.address;
            else point.addressError = resolved.error;
        }

        auto stored = repository_->put(point);
        invalidateOwner(ownerId);

        ReportResult result;
        result.success = true;
        result.message = "Stop event recorded";
        result.data = JsonCodec::pointToJson(stored);
        return result;
    } catch (const std::exception& e) {
        Log::error("Tracking", "Recording stop for owner " + std::to_string(ownerId) + " failed: " + e.what());
        return failure(std::string("Failed to record stop event: ") + e.what());
    }
}

} // namespace triplog::domain
