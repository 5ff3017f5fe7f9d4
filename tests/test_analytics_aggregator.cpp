#include <gtest/gtest.h>
#include "../core/domain/AnalyticsAggregator.hpp"
#include "../core/IClock.hpp"

using namespace triplog;
using namespace std::chrono_literals;

class AnalyticsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = *parseIso8601("2024-03-04T08:00:00Z");
    }

    TrackingPoint at(double lat, double lon, std::chrono::minutes offset,
                     std::optional<double> speed = std::nullopt,
                     std::optional<std::string> address = std::nullopt) {
        TrackingPoint point;
        point.lat = lat;
        point.lon = lon;
        point.accuracy = 10.0;
        point.speed = speed;
        point.address = address;
        point.capturedAt = base_ + offset;
        return point;
    }

    Stop stopAt(double lat, double lon, double minutes) {
        Stop stop;
        stop.lat = lat;
        stop.lon = lon;
        stop.durationMinutes = minutes;
        return stop;
    }

    TimePoint base_;
    domain::AnalyticsAggregator aggregator_;
};

TEST_F(AnalyticsAggregatorTest, RatingBands) {
    EXPECT_EQ(domain::AnalyticsAggregator::ratingFor(80), "High");
    EXPECT_EQ(domain::AnalyticsAggregator::ratingFor(79), "Medium");
    EXPECT_EQ(domain::AnalyticsAggregator::ratingFor(60), "Medium");
    EXPECT_EQ(domain::AnalyticsAggregator::ratingFor(59), "Low");
}

TEST_F(AnalyticsAggregatorTest, PointAnalyticsUseReportedSpeed) {
    std::vector<TrackingPoint> points = {
        at(-26.2041, 28.0473, 0min, 0.0, "Depot"),
        at(-26.2041, 28.0573, 5min, 10.0, "Depot"),
        at(-26.2041, 28.0673, 10min, 20.0, "Client A"),
    };

    auto analytics = aggregator_.pointAnalytics(points);

    EXPECT_DOUBLE_EQ(analytics.averageSpeedKmh, 10.0);
    EXPECT_DOUBLE_EQ(analytics.topSpeedKmh, 20.0);
    EXPECT_NEAR(analytics.movingTimeMinutes, 10.0, 1e-9);
    EXPECT_NEAR(analytics.stationaryTimeMinutes, 0.0, 1e-9);
    EXPECT_EQ(analytics.locationsVisited, 2u);
    ASSERT_TRUE(analytics.mostVisitedLocation.has_value());
    EXPECT_EQ(*analytics.mostVisitedLocation, "Depot");
    EXPECT_NEAR(analytics.totalDistanceKm, 2.0, 0.05);
}

TEST_F(AnalyticsAggregatorTest, TripSegmentsSplitOnLongPauses) {
    std::vector<TrackingPoint> points = {
        at(-26.2041, 28.0473, 0min, 30.0),
        at(-26.2041, 28.0473, 5min, 30.0),
        at(-26.2041, 28.0473, 10min, 30.0),
        at(-26.2041, 28.0473, 15min, 0.0),
        at(-26.2041, 28.0473, 20min, 0.0),
        at(-26.2041, 28.0473, 25min, 0.0),
        at(-26.2041, 28.0473, 30min, 40.0),
        at(-26.2041, 28.0473, 35min, 40.0),
    };

    auto segments = aggregator_.tripSegments(points);

    EXPECT_EQ(segments.count, 2u);
    EXPECT_NEAR(segments.longestMinutes, 15.0, 1e-9);
    EXPECT_NEAR(segments.shortestMinutes, 5.0, 1e-9);
    EXPECT_NEAR(segments.averageMinutes, 10.0, 1e-9);
}

TEST_F(AnalyticsAggregatorTest, EfficiencyRatingScoresEachComponent) {
    TripSummary trip;
    trip.averageSpeedKmh = 30.0;
    trip.totalDistanceKm = 20.0;
    trip.totalTimeMinutes = 60.0;
    StopDetectionResult stops;
    stops.averageStopDurationMinutes = 20.0;

    auto rating = aggregator_.efficiencyRating(trip, stops);

    EXPECT_EQ(rating.speedScore, 30);
    EXPECT_EQ(rating.stopScore, 30);
    EXPECT_EQ(rating.distanceScore, 40);
    EXPECT_EQ(rating.score, 100);
    EXPECT_EQ(rating.rating, "High");
    EXPECT_DOUBLE_EQ(rating.distancePerHourKm, 20.0);
}

TEST_F(AnalyticsAggregatorTest, EfficiencyBandEdgesScoreLower) {
    TripSummary trip;
    trip.averageSpeedKmh = 60.0;
    StopDetectionResult stops;
    stops.averageStopDurationMinutes = 15.0;

    auto rating = aggregator_.efficiencyRating(trip, stops);
    EXPECT_EQ(rating.speedScore, 20);
    EXPECT_EQ(rating.stopScore, 20);

    trip.averageSpeedKmh = 15.0;
    stops.averageStopDurationMinutes = 120.0;
    rating = aggregator_.efficiencyRating(trip, stops);
    EXPECT_EQ(rating.speedScore, 20);
    EXPECT_EQ(rating.stopScore, 20);
}

TEST_F(AnalyticsAggregatorTest, IdleDayRatesLow) {
    auto rating = aggregator_.efficiencyRating(TripSummary{}, StopDetectionResult{});
    EXPECT_EQ(rating.score, 30);
    EXPECT_EQ(rating.rating, "Low");
}

TEST_F(AnalyticsAggregatorTest, RouteOptimizationNeedsThreeStops) {
    auto route = aggregator_.routeOptimization({stopAt(0.0, 0.0, 20), stopAt(0.0, 0.1, 20)});
    EXPECT_FALSE(route.available);
    EXPECT_EQ(route.suggestion, "Not enough stops for route optimization");
}

TEST_F(AnalyticsAggregatorTest, RouteOptimizationRecommendsReversal) {
    // A -> B -> C doubles back; A -> C -> B does not.
    auto route = aggregator_.routeOptimization({
        stopAt(0.0, 0.0, 20), stopAt(0.0, 0.1, 20), stopAt(0.0, 0.05, 20)
    });

    EXPECT_TRUE(route.available);
    EXPECT_NEAR(route.currentDistanceKm, 16.68, 0.01);
    EXPECT_NEAR(route.alternativeDistanceKm, 11.12, 0.01);
    EXPECT_TRUE(route.recommended);
    EXPECT_EQ(route.suggestion, "Route could be optimized to save 5.6km");
}

TEST_F(AnalyticsAggregatorTest, StraightRouteIsAlreadyOptimal) {
    auto route = aggregator_.routeOptimization({
        stopAt(0.0, 0.0, 20), stopAt(0.0, 0.05, 20), stopAt(0.0, 0.1, 20)
    });

    EXPECT_FALSE(route.recommended);
    EXPECT_LT(route.savingsKm, 0.0);
    EXPECT_EQ(route.suggestion, "Current route appears well optimized");
}

TEST_F(AnalyticsAggregatorTest, PatternsNeedTenPoints) {
    std::vector<TrackingPoint> points;
    for (int i = 0; i < 5; ++i) {
        points.push_back(at(-26.2041, 28.0473 + 0.001 * i, std::chrono::minutes(5 * i)));
    }

    auto patterns = aggregator_.movementPatterns(points);
    EXPECT_FALSE(patterns.available);
    EXPECT_EQ(patterns.message, "Insufficient data for pattern analysis");
}

TEST_F(AnalyticsAggregatorTest, PatternsFindPeakHour) {
    std::vector<TrackingPoint> points;
    for (int i = 0; i < 12; ++i) {
        points.push_back(at(-26.2041, 28.0473 + 0.001 * i, std::chrono::minutes(5 * i)));
    }

    auto patterns = aggregator_.movementPatterns(points);

    ASSERT_TRUE(patterns.available);
    ASSERT_TRUE(patterns.peakHour.has_value());
    EXPECT_EQ(*patterns.peakHour, 8);
    EXPECT_EQ(patterns.hourly[8].points, 12u);
    EXPECT_EQ(patterns.message, "Peak movement between 8:00 and 9:00");
    ASSERT_EQ(patterns.topHours.size(), 1u);
}

TEST_F(AnalyticsAggregatorTest, TravelOptimizationFlagsShortVisits) {
    auto travel = aggregator_.travelOptimization({stopAt(0.0, 0.0, 25), stopAt(0.0, 0.05, 5)});

    EXPECT_EQ(travel.score, "High");
    ASSERT_EQ(travel.suggestions.size(), 1u);
    EXPECT_EQ(travel.suggestions[0], "Consider consolidating tasks at locations with short visits");
}

TEST_F(AnalyticsAggregatorTest, LongDistanceSuggestsGrouping) {
    // Two stops about 111 km apart.
    auto travel = aggregator_.travelOptimization({stopAt(0.0, 0.0, 25), stopAt(0.0, 1.0, 25)});

    EXPECT_EQ(travel.score, "Low");
    ASSERT_EQ(travel.suggestions.size(), 1u);
    EXPECT_EQ(travel.suggestions[0], "Consider grouping nearby visits to reduce total travel distance");
}

TEST_F(AnalyticsAggregatorTest, TravelEfficiency) {
    TripSummary trip;
    trip.averageSpeedKmh = 30.0;
    trip.maxSpeedKmh = 50.0;
    trip.movingTimeMinutes = 30.0;
    trip.totalTimeMinutes = 60.0;

    auto efficiency = aggregator_.travelEfficiency(trip);

    EXPECT_DOUBLE_EQ(efficiency.movingRatio, 0.5);
    EXPECT_EQ(efficiency.score, 100);
    EXPECT_EQ(efficiency.rating, "High");
}

TEST_F(AnalyticsAggregatorTest, ProductivityScoreIsShareOfLongStops) {
    EXPECT_EQ(aggregator_.productivityScore({}), 0);
    EXPECT_EQ(aggregator_.productivityScore({
        stopAt(0, 0, 20), stopAt(0, 0, 5), stopAt(0, 0, 30), stopAt(0, 0, 10)
    }), 50);
}

TEST_F(AnalyticsAggregatorTest, InsightsKeepFiveKeyLocations) {
    std::vector<Stop> stops;
    for (int i = 0; i < 7; ++i) {
        stops.push_back(stopAt(0.0, 0.01 * i, 20));
    }
    StopDetectionResult detected;
    detected.stops = stops;
    detected.averageStopDurationMinutes = 20.0;

    auto insights = aggregator_.insights({}, TripSummary{}, detected);

    EXPECT_EQ(insights.keyLocations.size(), 5u);
    EXPECT_EQ(insights.productivityScore, 100);
    EXPECT_TRUE(insights.route.available);
    EXPECT_FALSE(insights.patterns.available);
}
