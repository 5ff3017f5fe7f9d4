#pragma once

#include "ports/IUserDirectory.hpp"
#include "IClock.hpp"
#include "Timeframe.hpp"
#include "TrackingPoint.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace triplog {

// Raw values; rounding happens when a report is serialised.
struct TripSummary {
    double totalDistanceKm = 0.0;
    double totalTimeMinutes = 0.0;
    double movingTimeMinutes = 0.0;
    double stationaryTimeMinutes = 0.0;
    double averageSpeedKmh = 0.0;
    double maxSpeedKmh = 0.0;
    std::map<std::string, double> timeByAddressMinutes;

    size_t usablePoints = 0;
    size_t discardedForAccuracy = 0;
    size_t movingSegments = 0;
    size_t stationarySegments = 0;
    size_t jitterPairs = 0;
};

struct Stop {
    double lat = 0.0;
    double lon = 0.0;
    std::string address;
    TimePoint startTime;
    TimePoint endTime;
    double durationMinutes = 0.0;
    size_t pointCount = 0;
    std::string productivity;
};

struct StopLocation {
    std::string address;
    double lat = 0.0;
    double lon = 0.0;
    size_t visits = 0;
    double totalMinutes = 0.0;
};

struct StopDetectionResult {
    std::vector<Stop> stops;
    std::vector<StopLocation> locations;
    double averageStopDurationMinutes = 0.0;
};

// Derived from device-reported speed rather than from segment geometry.
struct PointAnalytics {
    double totalDistanceKm = 0.0;
    double averageSpeedKmh = 0.0;
    double topSpeedKmh = 0.0;
    double movingTimeMinutes = 0.0;
    double stationaryTimeMinutes = 0.0;
    size_t locationsVisited = 0;
    std::optional<std::string> mostVisitedLocation;
};

struct TripSegments {
    size_t count = 0;
    double averageMinutes = 0.0;
    double longestMinutes = 0.0;
    double shortestMinutes = 0.0;
};

struct EfficiencyRating {
    int score = 0;
    std::string rating = "Low";
    int speedScore = 0;
    int stopScore = 0;
    int distanceScore = 0;
    double distancePerHourKm = 0.0;
};

struct RouteOptimization {
    bool available = false;
    double currentDistanceKm = 0.0;
    double alternativeDistanceKm = 0.0;
    double savingsKm = 0.0;
    bool recommended = false;
    std::string suggestion;
};

struct HourlyBucket {
    double distanceKm = 0.0;
    size_t points = 0;
};

struct MovementPatterns {
    bool available = false;
    std::string message;
    std::array<HourlyBucket, 24> hourly{};
    std::optional<int> peakHour;
    std::vector<int> topHours;
};

struct TravelOptimization {
    double totalTravelDistanceKm = 0.0;
    std::string score = "High";
    std::vector<std::string> suggestions;
};

struct TravelEfficiency {
    double averageSpeedKmh = 0.0;
    double maxSpeedKmh = 0.0;
    double movingRatio = 0.0;
    int score = 0;
    std::string rating = "Low";
};

struct Insights {
    EfficiencyRating efficiency;
    RouteOptimization route;
    MovementPatterns patterns;
    TravelOptimization travel;
    TravelEfficiency travelEfficiency;
    int productivityScore = 0;
    std::vector<Stop> keyLocations;
};

struct GeocodingStatus {
    size_t successful = 0;
    size_t failed = 0;
    size_t usedFallback = 0;
};

struct BackfillSummary {
    size_t candidates = 0;
    size_t alreadyResolved = 0;
    size_t groups = 0;
    size_t groupsResolved = 0;
    size_t groupsFailed = 0;
    size_t groupsSkipped = 0;
    size_t resolvedPoints = 0;
    size_t failedPoints = 0;
    size_t skippedPoints = 0;
    size_t deferredPoints = 0;
    size_t externalCalls = 0;
    bool circuitOpen = false;

    std::vector<PointId> resolvedPointIds;
    std::vector<PointId> failedPointIds;
    std::vector<PointId> skippedPointIds;
};

struct RecalculationInfo {
    size_t originalPoints = 0;
    size_t filteredPoints = 0;
    size_t removedVirtualPoints = 0;
    TimePoint recalculatedAt;
};

struct TrackingReport {
    ports::OwnerProfile owner;
    Timeframe timeframe = Timeframe::Today;
    Period period;
    std::vector<TrackingPoint> points;

    PointAnalytics analytics;
    TripSummary trip;
    StopDetectionResult stops;
    TripSegments segments;
    Insights insights;
    GeocodingStatus geocoding;
    BackfillSummary backfill;
    std::optional<RecalculationInfo> recalculation;
};

} // namespace triplog
