#pragma once

#include "../Analytics.hpp"
#include "../EngineConfig.hpp"
#include <vector>

namespace triplog::domain {

// Advisory metrics layered over trip and stop results. Nothing here feeds
// back into TripSummary or Stop values.
class AnalyticsAggregator {
public:
    AnalyticsAggregator(AnalyticsConfig analytics = {}, TripConfig trip = {});

    PointAnalytics pointAnalytics(const std::vector<TrackingPoint>& points) const;
    TripSegments tripSegments(const std::vector<TrackingPoint>& points) const;

    EfficiencyRating efficiencyRating(const TripSummary& trip, const StopDetectionResult& stops) const;
    RouteOptimization routeOptimization(const std::vector<Stop>& stops) const;
    MovementPatterns movementPatterns(const std::vector<TrackingPoint>& points) const;
    TravelOptimization travelOptimization(const std::vector<Stop>& stops) const;
    TravelEfficiency travelEfficiency(const TripSummary& trip) const;
    int productivityScore(const std::vector<Stop>& stops) const;

    Insights insights(const std::vector<TrackingPoint>& points,
                      const TripSummary& trip,
                      const StopDetectionResult& stops) const;

    static std::string ratingFor(int score);
    static double pathLengthKm(const std::vector<Stop>& stops);

private:
    AnalyticsConfig analytics_;
    TripConfig trip_;
};

} // namespace triplog::domain
