#include "TripAnalyzer.hpp"
#include "../Geo.hpp"
#include <algorithm>

namespace triplog::domain {

namespace {

double minutesBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

} // namespace

TripAnalyzer::TripAnalyzer(TripConfig config, ValidationConfig validation)
    : config_(config), validator_(std::move(validation)) {
}

std::string TripAnalyzer::addressLabel(const TrackingPoint& point) {
    return point.hasAddress() ? *point.address : Geo::fallbackAddress(point.lat, point.lon);
}

TripSummary TripAnalyzer::analyze(const std::vector<TrackingPoint>& input) const {
    TripSummary summary;

    auto filtered = validator_.filterByAccuracy(input);
    auto& points = filtered.points;
    summary.discardedForAccuracy = input.size() - points.size();
    summary.usablePoints = points.size();

    if (points.size() < 2) {
        return summary;
    }

    std::stable_sort(points.begin(), points.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
        return a.capturedAt < b.capturedAt;
    });

    const double minIntervalSeconds = std::chrono::duration<double>(config_.minInterval).count();
    double movingHours = 0.0;

    for (size_t i = 1; i < points.size(); ++i) {
        const auto& prev = points[i - 1];
        const auto& curr = points[i];

        double seconds = std::chrono::duration<double>(curr.capturedAt - prev.capturedAt).count();
        summary.timeByAddressMinutes[addressLabel(prev)] += seconds / 60.0;

        double km = Geo::distanceKm(prev.lat, prev.lon, curr.lat, curr.lon);
        if (seconds < minIntervalSeconds || km * 1000.0 < config_.minDistanceMeters) {
            ++summary.jitterPairs;
            continue;
        }

        double hours = seconds / 3600.0;
        double speed = std::min(km / hours, config_.maxSpeedKmh);

        summary.totalDistanceKm += km;
        summary.maxSpeedKmh = std::max(summary.maxSpeedKmh, speed);

        if (speed < config_.movingSpeedKmh) {
            ++summary.stationarySegments;
        } else {
            ++summary.movingSegments;
            movingHours += hours;
        }
    }

    summary.totalTimeMinutes = minutesBetween(points.front().capturedAt, points.back().capturedAt);
    summary.movingTimeMinutes = movingHours * 60.0;
    summary.stationaryTimeMinutes = std::max(0.0, summary.totalTimeMinutes - summary.movingTimeMinutes);

    if (movingHours > 0.0) {
        summary.averageSpeedKmh = std::min(summary.totalDistanceKm / movingHours, config_.maxSpeedKmh);
    }

    return summary;
}

} // namespace triplog::domain
