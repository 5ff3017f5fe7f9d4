#include "AnalyticsAggregator.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace triplog::domain {

namespace {

double minutesBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

int utcHour(TimePoint time) {
    int64_t ms = toEpochMillis(time);
    int64_t msOfDay = ms % (24LL * 3600 * 1000);
    if (msOfDay < 0) msOfDay += 24LL * 3600 * 1000;
    return static_cast<int>(msOfDay / (3600 * 1000));
}

} // namespace

AnalyticsAggregator::AnalyticsAggregator(AnalyticsConfig analytics, TripConfig trip)
    : analytics_(analytics), trip_(trip) {
}

std::string AnalyticsAggregator::ratingFor(int score) {
    if (score >= 80) return "High";
    if (score >= 60) return "Medium";
    return "Low";
}

double AnalyticsAggregator::pathLengthKm(const std::vector<Stop>& stops) {
    double km = 0.0;
    for (size_t i = 1; i < stops.size(); ++i) {
        km += Geo::distanceKm(stops[i - 1].lat, stops[i - 1].lon, stops[i].lat, stops[i].lon);
    }
    return km;
}

PointAnalytics AnalyticsAggregator::pointAnalytics(const std::vector<TrackingPoint>& points) const {
    PointAnalytics result;

    double speedSum = 0.0;
    size_t speedCount = 0;
    std::map<std::string, size_t> visits;

    for (size_t i = 0; i < points.size(); ++i) {
        const auto& point = points[i];
        if (point.speed) {
            speedSum += *point.speed;
            ++speedCount;
            result.topSpeedKmh = std::max(result.topSpeedKmh, *point.speed);
        }
        if (point.hasAddress()) {
            ++visits[*point.address];
        }

        if (i == 0) continue;
        const auto& prev = points[i - 1];
        result.totalDistanceKm += Geo::distanceKm(prev.lat, prev.lon, point.lat, point.lon);

        double minutes = minutesBetween(prev.capturedAt, point.capturedAt);
        if (point.speed.value_or(0.0) > trip_.reportedMovingSpeedKmh) {
            result.movingTimeMinutes += minutes;
        } else {
            result.stationaryTimeMinutes += minutes;
        }
    }

    if (speedCount > 0) {
        result.averageSpeedKmh = speedSum / static_cast<double>(speedCount);
    }

    result.locationsVisited = visits.size();
    size_t best = 0;
    for (const auto& [address, count] : visits) {
        if (count > best) {
            best = count;
            result.mostVisitedLocation = address;
        }
    }
    return result;
}

TripSegments AnalyticsAggregator::tripSegments(const std::vector<TrackingPoint>& points) const {
    std::vector<double> durations;

    bool inTrip = false;
    TimePoint tripStart;
    std::optional<TimePoint> stationarySince;

    for (const auto& point : points) {
        bool moving = point.speed.value_or(0.0) > trip_.movingSpeedKmh;
        if (moving) {
            if (!inTrip) {
                inTrip = true;
                tripStart = point.capturedAt;
            }
            stationarySince.reset();
            continue;
        }

        if (!inTrip) continue;
        if (!stationarySince) {
            stationarySince = point.capturedAt;
        }
        if (point.capturedAt - *stationarySince >= trip_.tripBreak) {
            durations.push_back(minutesBetween(tripStart, *stationarySince));
            inTrip = false;
            stationarySince.reset();
        }
    }

    if (inTrip && !points.empty()) {
        TimePoint end = stationarySince ? *stationarySince : points.back().capturedAt;
        durations.push_back(minutesBetween(tripStart, end));
    }

    TripSegments result;
    result.count = durations.size();
    if (durations.empty()) return result;

    double total = 0.0;
    result.longestMinutes = durations.front();
    result.shortestMinutes = durations.front();
    for (double d : durations) {
        total += d;
        result.longestMinutes = std::max(result.longestMinutes, d);
        result.shortestMinutes = std::min(result.shortestMinutes, d);
    }
    result.averageMinutes = total / static_cast<double>(durations.size());
    return result;
}

EfficiencyRating AnalyticsAggregator::efficiencyRating(const TripSummary& trip,
                                                       const StopDetectionResult& stops) const {
    EfficiencyRating result;

    double speed = trip.averageSpeedKmh;
    if (speed > 15.0 && speed < 60.0) result.speedScore = 30;
    else if (speed > 10.0) result.speedScore = 20;
    else result.speedScore = 10;

    double stop = stops.averageStopDurationMinutes;
    if (stop > 15.0 && stop < 120.0) result.stopScore = 30;
    else if (stop > 10.0) result.stopScore = 20;
    else result.stopScore = 10;

    double hours = trip.totalTimeMinutes / 60.0;
    result.distancePerHourKm = hours > 0.0 ? trip.totalDistanceKm / hours : 0.0;
    if (result.distancePerHourKm > 5.0) result.distanceScore = 40;
    else if (result.distancePerHourKm > 2.0) result.distanceScore = 30;
    else if (result.distancePerHourKm > 1.0) result.distanceScore = 20;
    else result.distanceScore = 10;

    result.score = result.speedScore + result.stopScore + result.distanceScore;
    result.rating = ratingFor(result.score);
    return result;
}

RouteOptimization AnalyticsAggregator::routeOptimization(const std::vector<Stop>& stops) const {
    RouteOptimization result;
    if (stops.size() < 3) {
        result.suggestion = "Not enough stops for route optimization";
        return result;
    }

    result.available = true;
    result.currentDistanceKm = pathLengthKm(stops);

    // Keep the starting stop and visit the rest in reverse order.
    std::vector<Stop> alternative;
    alternative.push_back(stops.front());
    alternative.insert(alternative.end(), stops.rbegin(), stops.rend() - 1);
    result.alternativeDistanceKm = pathLengthKm(alternative);

    result.savingsKm = result.currentDistanceKm - result.alternativeDistanceKm;
    result.recommended = result.savingsKm > analytics_.routeSavingsThresholdKm;

    if (result.recommended) {
        std::ostringstream ss;
        ss << "Route could be optimized to save " << std::fixed << std::setprecision(1)
           << result.savingsKm << "km";
        result.suggestion = ss.str();
    } else {
        result.suggestion = "Current route appears well optimized";
    }
    return result;
}

MovementPatterns AnalyticsAggregator::movementPatterns(const std::vector<TrackingPoint>& points) const {
    MovementPatterns result;
    if (points.size() < analytics_.minPointsForPatterns) {
        result.message = "Insufficient data for pattern analysis";
        return result;
    }

    result.available = true;
    for (size_t i = 0; i < points.size(); ++i) {
        auto& bucket = result.hourly[static_cast<size_t>(utcHour(points[i].capturedAt))];
        ++bucket.points;
        if (i > 0) {
            const auto& prev = points[i - 1];
            auto& from = result.hourly[static_cast<size_t>(utcHour(prev.capturedAt))];
            from.distanceKm += Geo::distanceKm(prev.lat, prev.lon, points[i].lat, points[i].lon);
        }
    }

    std::vector<int> hours;
    for (int h = 0; h < 24; ++h) {
        if (result.hourly[static_cast<size_t>(h)].distanceKm > 0.0) hours.push_back(h);
    }
    std::stable_sort(hours.begin(), hours.end(), [&](int a, int b) {
        return result.hourly[static_cast<size_t>(a)].distanceKm > result.hourly[static_cast<size_t>(b)].distanceKm;
    });

    if (!hours.empty()) {
        result.peakHour = hours.front();
        result.message = "Peak movement between " + std::to_string(hours.front()) + ":00 and " +
                         std::to_string((hours.front() + 1) % 24) + ":00";
    } else {
        result.message = "No movement recorded";
    }
    if (hours.size() > 5) hours.resize(5);
    result.topHours = hours;
    return result;
}

TravelOptimization AnalyticsAggregator::travelOptimization(const std::vector<Stop>& stops) const {
    TravelOptimization result;
    result.totalTravelDistanceKm = pathLengthKm(stops);

    if (result.totalTravelDistanceKm < 30.0) result.score = "High";
    else if (result.totalTravelDistanceKm < 60.0) result.score = "Medium";
    else result.score = "Low";

    if (result.totalTravelDistanceKm > analytics_.longDistanceKm) {
        result.suggestions.push_back("Consider grouping nearby visits to reduce total travel distance");
    }
    bool shortStops = std::any_of(stops.begin(), stops.end(),
                                  [](const Stop& s) { return s.durationMinutes < 10.0; });
    if (shortStops) {
        result.suggestions.push_back("Consider consolidating tasks at locations with short visits");
    }
    return result;
}

TravelEfficiency AnalyticsAggregator::travelEfficiency(const TripSummary& trip) const {
    TravelEfficiency result;
    result.averageSpeedKmh = trip.averageSpeedKmh;
    result.maxSpeedKmh = trip.maxSpeedKmh;
    result.movingRatio = trip.totalTimeMinutes > 0.0 ? trip.movingTimeMinutes / trip.totalTimeMinutes : 0.0;

    int score = 0;
    if (result.averageSpeedKmh > 20.0) score += 30;
    else if (result.averageSpeedKmh > 10.0) score += 20;
    else score += 10;

    if (result.movingRatio > 0.4) score += 30;
    else if (result.movingRatio > 0.2) score += 20;
    else score += 10;

    if (result.maxSpeedKmh >= 30.0 && result.maxSpeedKmh <= 80.0) score += 40;
    else score += 20;

    result.score = score;
    result.rating = ratingFor(score);
    return result;
}

int AnalyticsAggregator::productivityScore(const std::vector<Stop>& stops) const {
    if (stops.empty()) return 0;
    auto productive = std::count_if(stops.begin(), stops.end(),
                                    [](const Stop& s) { return s.durationMinutes >= 15.0; });
    return static_cast<int>(std::lround(100.0 * static_cast<double>(productive) /
                                        static_cast<double>(stops.size())));
}

Insights AnalyticsAggregator::insights(const std::vector<TrackingPoint>& points,
                                       const TripSummary& trip,
                                       const StopDetectionResult& stops) const {
    Insights result;
    result.efficiency = efficiencyRating(trip, stops);
    result.route = routeOptimization(stops.stops);
    result.patterns = movementPatterns(points);
    result.travel = travelOptimization(stops.stops);
    result.travelEfficiency = travelEfficiency(trip);
    result.productivityScore = productivityScore(stops.stops);

    size_t keyCount = std::min<size_t>(stops.stops.size(), 5);
    result.keyLocations.assign(stops.stops.begin(), stops.stops.begin() + static_cast<std::ptrdiff_t>(keyCount));
    return result;
}

} // namespace triplog::domain
