#include "StopDetector.hpp"
#include "../Geo.hpp"
#include <algorithm>

namespace triplog::domain {

StopDetector::StopDetector(StopConfig config, ValidationConfig validation)
    : config_(config), validator_(std::move(validation)) {
}

std::string StopDetector::productivityLabel(double durationMinutes) {
    if (durationMinutes >= 60.0) return "High";
    if (durationMinutes >= 30.0) return "Medium";
    if (durationMinutes >= 15.0) return "Low";
    return "Minimal";
}

StopDetectionResult StopDetector::detectStops(const std::vector<TrackingPoint>& input) const {
    StopDetectionResult result;

    auto points = validator_.filterByAccuracy(input).points;
    if (points.empty()) {
        return result;
    }

    std::stable_sort(points.begin(), points.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
        return a.capturedAt < b.capturedAt;
    });

    auto startCluster = [](const TrackingPoint& point) {
        Cluster cluster;
        cluster.lat = point.lat;
        cluster.lon = point.lon;
        cluster.count = 1;
        cluster.start = point.capturedAt;
        cluster.end = point.capturedAt;
        if (point.hasAddress()) cluster.address = point.address;
        return cluster;
    };

    Cluster current = startCluster(points.front());
    for (size_t i = 1; i < points.size(); ++i) {
        const auto& point = points[i];
        double meters = Geo::distanceMeters(current.lat, current.lon, point.lat, point.lon);

        if (meters <= config_.radiusMeters) {
            double n = static_cast<double>(current.count);
            current.lat = (current.lat * n + point.lat) / (n + 1.0);
            current.lon = (current.lon * n + point.lon) / (n + 1.0);
            ++current.count;
            current.end = point.capturedAt;
            if (point.hasAddress()) current.address = point.address;
        } else {
            close(current, result.stops);
            current = startCluster(point);
        }
    }
    close(current, result.stops);

    double totalMinutes = 0.0;
    for (const auto& stop : result.stops) {
        totalMinutes += stop.durationMinutes;

        auto it = std::find_if(result.locations.begin(), result.locations.end(),
                               [&](const StopLocation& loc) { return loc.address == stop.address; });
        if (it == result.locations.end()) {
            StopLocation location;
            location.address = stop.address;
            location.lat = stop.lat;
            location.lon = stop.lon;
            result.locations.push_back(location);
            it = result.locations.end() - 1;
        }
        ++it->visits;
        it->totalMinutes += stop.durationMinutes;
    }

    if (!result.stops.empty()) {
        result.averageStopDurationMinutes = totalMinutes / static_cast<double>(result.stops.size());
    }
    return result;
}

void StopDetector::close(const Cluster& cluster, std::vector<Stop>& stops) const {
    auto duration = cluster.end - cluster.start;
    if (duration < config_.minDuration) return;

    Stop stop;
    stop.lat = cluster.lat;
    stop.lon = cluster.lon;
    stop.address = cluster.address ? *cluster.address : Geo::fallbackAddress(cluster.lat, cluster.lon);
    stop.startTime = cluster.start;
    stop.endTime = cluster.end;
    stop.durationMinutes = std::chrono::duration<double, std::ratio<60>>(duration).count();
    stop.pointCount = cluster.count;
    stop.productivity = productivityLabel(stop.durationMinutes);
    stops.push_back(stop);
}

} // namespace triplog::domain
