#include "JsonCodec.hpp"
#include "Geo.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace triplog {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Whole numbers inside the id range only; 2^63 itself is out of range.
std::optional<OwnerId> integralOwner(double value) {
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || std::trunc(value) != value || value < -kLimit || value >= kLimit) {
        return std::nullopt;
    }
    return static_cast<OwnerId>(value);
}

std::optional<OwnerId> ownerField(const nlohmann::json& json) {
    for (const char* key : {"owner", "ownerId", "userId"}) {
        if (!json.contains(key)) continue;
        const auto& value = json[key];
        if (value.is_object() && value.contains("id")) {
            const auto& id = value["id"];
            if (id.is_number_integer()) return id.get<OwnerId>();
        } else if (value.is_number_unsigned()) {
            if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<OwnerId>::max())) {
                return std::nullopt;
            }
            return static_cast<OwnerId>(value.get<uint64_t>());
        } else if (value.is_number_integer()) {
            return value.get<OwnerId>();
        } else if (value.is_number_float()) {
            return integralOwner(value.get<double>());
        } else if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            try {
                size_t used = 0;
                long long id = std::stoll(text, &used);
                if (used == text.size()) return static_cast<OwnerId>(id);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace

double JsonCodec::round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

double JsonCodec::round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

int64_t JsonCodec::roundWhole(double value) {
    return static_cast<int64_t>(std::llround(value));
}

std::optional<double> JsonCodec::numberField(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) return std::nullopt;
    const auto& value = json[key];
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        try {
            size_t used = 0;
            double parsed = std::stod(text, &used);
            if (used == text.size() && std::isfinite(parsed)) return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

LocationSample JsonCodec::parseSample(const std::string& json) {
    auto parsed = nlohmann::json::parse(json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw std::invalid_argument("Location payload must be a JSON object");
    }
    return jsonToSample(parsed);
}

LocationSample JsonCodec::jsonToSample(const nlohmann::json& json) {
    LocationSample sample;
    if (!json.is_object()) return sample;

    sample.ownerId = ownerField(json);

    // Un-nest "coords" when the flat fields are absent.
    const nlohmann::json* source = &json;
    bool flat = json.contains("latitude") && json.contains("longitude");
    if (!flat && json.contains("coords") && json["coords"].is_object()) {
        source = &json["coords"];
    }

    sample.lat = numberField(*source, "latitude");
    sample.lon = numberField(*source, "longitude");
    sample.accuracy = numberField(*source, "accuracy");
    sample.speed = numberField(*source, "speed");
    sample.heading = numberField(*source, "heading");
    sample.altitude = numberField(*source, "altitude");
    sample.altitudeAccuracy = numberField(*source, "altitudeAccuracy");

    sample.timestampMs = numberField(json, "timestamp");
    if (!sample.timestampMs && source != &json) {
        sample.timestampMs = numberField(*source, "timestamp");
    }
    return sample;
}

nlohmann::json JsonCodec::pointToJson(const TrackingPoint& point) {
    nlohmann::json j;

    j["id"] = point.id;
    j["ownerId"] = point.ownerId;
    j["latitude"] = point.lat;
    j["longitude"] = point.lon;
    j["accuracy"] = optionalToJson(point.accuracy);
    j["speed"] = optionalToJson(point.speed);
    j["heading"] = optionalToJson(point.heading);
    j["altitude"] = optionalToJson(point.altitude);
    j["altitudeAccuracy"] = optionalToJson(point.altitudeAccuracy);
    j["timestamp"] = point.deviceTimestampMs;
    j["capturedAt"] = formatIso8601(point.capturedAt);
    j["receivedAt"] = formatIso8601(point.receivedAt);
    j["address"] = optionalToJson(point.address);
    j["addressDecodingError"] = optionalToJson(point.addressError);
    j["displayAddress"] = point.hasAddress() ? *point.address : Geo::fallbackAddress(point.lat, point.lon);
    j["rawLocation"] = point.rawLocation;
    j["organizationId"] = optionalToJson(point.scope.organizationId);
    j["branchId"] = optionalToJson(point.scope.branchId);

    if (point.deletedAt) {
        j["deletedAt"] = formatIso8601(*point.deletedAt);
        j["deletedBy"] = optionalToJson(point.deletedBy);
    }

    j["isStop"] = point.stop.has_value();
    if (point.stop) {
        j["stopStartTime"] = formatIso8601(point.stop->startTime);
        j["stopEndTime"] = formatIso8601(point.stop->endTime);
        j["stopDurationMinutes"] = point.stop->durationMinutes;
    }
    return j;
}

nlohmann::json JsonCodec::warningToJson(const Warning& warning) {
    nlohmann::json j;
    j["type"] = warningTypeToString(warning.type);
    j["message"] = warning.message;
    for (const auto& [key, value] : warning.details) {
        j[key] = value;
    }
    return j;
}

nlohmann::json JsonCodec::ingestResultToJson(const IngestResult& result) {
    nlohmann::json j;
    j["stored"] = result.stored;
    j["message"] = result.message;
    j["data"] = result.data ? pointToJson(*result.data) : nlohmann::json(nullptr);

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        warnings.push_back(warningToJson(warning));
    }
    j["warnings"] = warnings;

    if (result.isError()) {
        j["error"] = {
            {"kind", ingestErrorKindToString(result.errorKind)},
            {"message", result.errorMessage}
        };
    }
    return j;
}

std::string JsonCodec::serialize(const IngestResult& result) {
    return ingestResultToJson(result).dump();
}

nlohmann::json JsonCodec::ownerToJson(const ports::OwnerProfile& owner) {
    return {
        {"id", owner.id},
        {"name", owner.name},
        {"email", owner.email},
        {"organizationId", optionalToJson(owner.scope.organizationId)},
        {"branchId", optionalToJson(owner.scope.branchId)},
        {"organizationName", owner.organizationName},
        {"branchName", owner.branchName}
    };
}

ports::OwnerProfile JsonCodec::jsonToOwner(const nlohmann::json& json) {
    ports::OwnerProfile owner;
    owner.id = json.value("id", OwnerId{0});
    owner.name = json.value("name", "");
    owner.email = json.value("email", "");
    owner.organizationName = json.value("organizationName", "");
    owner.branchName = json.value("branchName", "");

    if (json.contains("organizationId") && json["organizationId"].is_number_integer()) {
        owner.scope.organizationId = json["organizationId"].get<int64_t>();
    }
    if (json.contains("branchId") && json["branchId"].is_number_integer()) {
        owner.scope.branchId = json["branchId"].get<int64_t>();
    }
    return owner;
}

nlohmann::json JsonCodec::periodToJson(const Period& period) {
    return {
        {"start", formatIso8601(period.start)},
        {"end", formatIso8601(period.end)}
    };
}

nlohmann::json JsonCodec::tripSummaryToJson(const TripSummary& trip) {
    int64_t total = roundWhole(trip.totalTimeMinutes);
    int64_t moving = std::min(roundWhole(trip.movingTimeMinutes), total);

    nlohmann::json timeByAddress = nlohmann::json::array();
    for (const auto& [address, minutes] : trip.timeByAddressMinutes) {
        timeByAddress.push_back({
            {"address", address},
            {"minutes", roundWhole(minutes)},
            {"formatted", Geo::formatDuration(roundWhole(minutes))}
        });
    }

    return {
        {"totalDistanceKm", round2(trip.totalDistanceKm)},
        {"totalDistanceFormatted", Geo::formatDistance(trip.totalDistanceKm)},
        {"totalTimeMinutes", total},
        {"movingTimeMinutes", moving},
        {"stoppedTimeMinutes", total - moving},
        {"totalDurationFormatted", Geo::formatDuration(total)},
        {"averageSpeedKmh", round1(trip.averageSpeedKmh)},
        {"maxSpeedKmh", round1(trip.maxSpeedKmh)},
        {"timeByAddress", timeByAddress},
        {"usablePoints", trip.usablePoints},
        {"discardedForAccuracy", trip.discardedForAccuracy},
        {"movingSegments", trip.movingSegments},
        {"stationarySegments", trip.stationarySegments}
    };
}

nlohmann::json JsonCodec::stopToJson(const Stop& stop) {
    int64_t minutes = roundWhole(stop.durationMinutes);
    return {
        {"latitude", stop.lat},
        {"longitude", stop.lon},
        {"address", stop.address},
        {"startTime", formatIso8601(stop.startTime)},
        {"endTime", formatIso8601(stop.endTime)},
        {"durationMinutes", minutes},
        {"durationFormatted", Geo::formatDuration(minutes)},
        {"pointCount", stop.pointCount},
        {"productivity", stop.productivity}
    };
}

nlohmann::json JsonCodec::stopsToJson(const StopDetectionResult& stops) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& stop : stops.stops) {
        list.push_back(stopToJson(stop));
    }

    nlohmann::json locations = nlohmann::json::array();
    for (const auto& location : stops.locations) {
        locations.push_back({
            {"address", location.address},
            {"latitude", location.lat},
            {"longitude", location.lon},
            {"visits", location.visits},
            {"totalMinutes", roundWhole(location.totalMinutes)}
        });
    }

    return {
        {"stops", list},
        {"locations", locations},
        {"totalStops", stops.stops.size()},
        {"averageStopDuration", roundWhole(stops.averageStopDurationMinutes)}
    };
}

nlohmann::json JsonCodec::analyticsToJson(const PointAnalytics& analytics, const TripSegments& segments) {
    return {
        {"totalDistance", round2(analytics.totalDistanceKm)},
        {"totalDistanceFormatted", Geo::formatDistance(analytics.totalDistanceKm)},
        {"averageSpeed", round1(analytics.averageSpeedKmh)},
        {"topSpeed", round1(analytics.topSpeedKmh)},
        {"movingTimeMinutes", roundWhole(analytics.movingTimeMinutes)},
        {"stationaryTimeMinutes", roundWhole(analytics.stationaryTimeMinutes)},
        {"locationsVisited", analytics.locationsVisited},
        {"mostVisitedLocation", optionalToJson(analytics.mostVisitedLocation)},
        {"tripSegments", {
            {"count", segments.count},
            {"averageMinutes", roundWhole(segments.averageMinutes)},
            {"longestMinutes", roundWhole(segments.longestMinutes)},
            {"shortestMinutes", roundWhole(segments.shortestMinutes)}
        }}
    };
}

nlohmann::json JsonCodec::insightsToJson(const Insights& insights) {
    nlohmann::json hourly = nlohmann::json::array();
    for (size_t h = 0; h < insights.patterns.hourly.size(); ++h) {
        const auto& bucket = insights.patterns.hourly[h];
        if (bucket.points == 0 && bucket.distanceKm == 0.0) continue;
        hourly.push_back({
            {"hour", h},
            {"distanceKm", round2(bucket.distanceKm)},
            {"points", bucket.points}
        });
    }

    nlohmann::json keyLocations = nlohmann::json::array();
    for (const auto& stop : insights.keyLocations) {
        keyLocations.push_back({
            {"address", stop.address},
            {"durationMinutes", roundWhole(stop.durationMinutes)},
            {"productivity", stop.productivity}
        });
    }

    return {
        {"efficiency", {
            {"score", insights.efficiency.score},
            {"rating", insights.efficiency.rating},
            {"speedScore", insights.efficiency.speedScore},
            {"stopScore", insights.efficiency.stopScore},
            {"distanceScore", insights.efficiency.distanceScore},
            {"distancePerHourKm", round2(insights.efficiency.distancePerHourKm)}
        }},
        {"routeOptimization", {
            {"available", insights.route.available},
            {"currentDistanceKm", round2(insights.route.currentDistanceKm)},
            {"alternativeDistanceKm", round2(insights.route.alternativeDistanceKm)},
            {"savingsKm", round1(insights.route.savingsKm)},
            {"recommended", insights.route.recommended},
            {"suggestion", insights.route.suggestion}
        }},
        {"movementPatterns", {
            {"available", insights.patterns.available},
            {"message", insights.patterns.message},
            {"hourly", hourly},
            {"peakHour", optionalToJson(insights.patterns.peakHour)},
            {"topHours", insights.patterns.topHours}
        }},
        {"travelOptimization", {
            {"totalTravelDistanceKm", round2(insights.travel.totalTravelDistanceKm)},
            {"score", insights.travel.score},
            {"suggestions", insights.travel.suggestions}
        }},
        {"travelEfficiency", {
            {"averageSpeedKmh", round1(insights.travelEfficiency.averageSpeedKmh)},
            {"maxSpeedKmh", round1(insights.travelEfficiency.maxSpeedKmh)},
            {"movingRatio", round2(insights.travelEfficiency.movingRatio)},
            {"score", insights.travelEfficiency.score},
            {"rating", insights.travelEfficiency.rating}
        }},
        {"productivityScore", insights.productivityScore},
        {"keyLocations", keyLocations}
    };
}

nlohmann::json JsonCodec::geocodingStatusToJson(const GeocodingStatus& status) {
    return {
        {"successful", status.successful},
        {"failed", status.failed},
        {"usedFallback", status.usedFallback}
    };
}

nlohmann::json JsonCodec::backfillSummaryToJson(const BackfillSummary& summary) {
    return {
        {"candidates", summary.candidates},
        {"alreadyResolved", summary.alreadyResolved},
        {"groups", summary.groups},
        {"groupsResolved", summary.groupsResolved},
        {"groupsFailed", summary.groupsFailed},
        {"groupsSkipped", summary.groupsSkipped},
        {"resolvedPoints", summary.resolvedPoints},
        {"failedPoints", summary.failedPoints},
        {"skippedPoints", summary.skippedPoints},
        {"deferredPoints", summary.deferredPoints},
        {"externalCalls", summary.externalCalls},
        {"circuitOpen", summary.circuitOpen}
    };
}

nlohmann::json JsonCodec::recalculationToJson(const RecalculationInfo& info) {
    return {
        {"originalPoints", info.originalPoints},
        {"filteredPoints", info.filteredPoints},
        {"removedVirtualPoints", info.removedVirtualPoints},
        {"recalculatedAt", formatIso8601(info.recalculatedAt)}
    };
}

nlohmann::json JsonCodec::reportToJson(const TrackingReport& report) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& point : report.points) {
        points.push_back(pointToJson(point));
    }

    nlohmann::json j;
    j["user"] = ownerToJson(report.owner);
    j["timeframe"] = timeframeToString(report.timeframe);
    j["period"] = periodToJson(report.period);
    j["totalPoints"] = report.points.size();
    j["trackingPoints"] = points;
    j["analytics"] = analyticsToJson(report.analytics, report.segments);
    j["tripSummary"] = tripSummaryToJson(report.trip);
    j["stops"] = stopsToJson(report.stops);
    j["insights"] = insightsToJson(report.insights);
    j["geocodingStatus"] = geocodingStatusToJson(report.geocoding);
    j["backfill"] = backfillSummaryToJson(report.backfill);
    if (report.recalculation) {
        j["recalculationInfo"] = recalculationToJson(*report.recalculation);
    }
    return j;
}

} // namespace triplog
