#include <gtest/gtest.h>
#include "../core/domain/StopDetector.hpp"
#include "../core/sim/SimulatedClock.hpp"

using namespace triplog;
using namespace std::chrono_literals;

class StopDetectorTest : public ::testing::Test {
protected:
    TrackingPoint at(double lat, double lon, std::chrono::minutes offset,
                     std::optional<std::string> address = std::nullopt) {
        TrackingPoint point;
        point.ownerId = 42;
        point.lat = lat;
        point.lon = lon;
        point.accuracy = 10.0;
        point.capturedAt = clock_.now() + offset;
        point.address = address;
        return point;
    }

    // One fix per minute within a few metres of the given spot.
    void dwell(std::vector<TrackingPoint>& points, double lat, double lon,
               int startMinute, int minutes, std::optional<std::string> address = std::nullopt) {
        for (int i = 0; i <= minutes; ++i) {
            points.push_back(at(lat + 0.00001 * (i % 3), lon, std::chrono::minutes(startMinute + i), address));
        }
    }

    sim::SimulatedClock clock_;
    domain::StopDetector detector_;
};

TEST_F(StopDetectorTest, EmptyInputHasNoStops) {
    auto result = detector_.detectStops({});
    EXPECT_TRUE(result.stops.empty());
    EXPECT_DOUBLE_EQ(result.averageStopDurationMinutes, 0.0);
}

TEST_F(StopDetectorTest, DwellOfFiveMinutesIsOneStop) {
    std::vector<TrackingPoint> points;
    dwell(points, -26.2041, 28.0473, 0, 5);

    auto result = detector_.detectStops(points);

    ASSERT_EQ(result.stops.size(), 1u);
    const auto& stop = result.stops.front();
    EXPECT_NEAR(stop.durationMinutes, 5.0, 1e-9);
    EXPECT_EQ(stop.pointCount, 6u);
    EXPECT_EQ(stop.productivity, "Minimal");
    EXPECT_NEAR(stop.lat, -26.2041, 0.0001);
    EXPECT_EQ(stop.address, "-26.2041, 28.0473");
}

TEST_F(StopDetectorTest, ShortDwellIsDropped) {
    std::vector<TrackingPoint> points;
    dwell(points, -26.2041, 28.0473, 0, 2);

    EXPECT_TRUE(detector_.detectStops(points).stops.empty());
}

TEST_F(StopDetectorTest, LeavingTheRadiusClosesTheStop) {
    std::vector<TrackingPoint> points;
    dwell(points, -26.2041, 28.0473, 0, 10, "Office");
    // About 1.1 km away, only two minutes.
    dwell(points, -26.1941, 28.0473, 12, 2);

    auto result = detector_.detectStops(points);

    ASSERT_EQ(result.stops.size(), 1u);
    EXPECT_EQ(result.stops[0].address, "Office");
    EXPECT_NEAR(result.stops[0].durationMinutes, 10.0, 1e-9);
}

TEST_F(StopDetectorTest, RepeatedVisitsAggregateByAddress) {
    std::vector<TrackingPoint> points;
    dwell(points, -26.2041, 28.0473, 0, 70, "Office");
    dwell(points, -26.1941, 28.0473, 80, 20, "Cafe");
    dwell(points, -26.2041, 28.0473, 110, 30, "Office");

    auto result = detector_.detectStops(points);

    ASSERT_EQ(result.stops.size(), 3u);
    EXPECT_EQ(result.stops[0].productivity, "High");
    EXPECT_EQ(result.stops[1].productivity, "Low");
    EXPECT_EQ(result.stops[2].productivity, "Medium");

    ASSERT_EQ(result.locations.size(), 2u);
    EXPECT_EQ(result.locations[0].address, "Office");
    EXPECT_EQ(result.locations[0].visits, 2u);
    EXPECT_NEAR(result.locations[0].totalMinutes, 100.0, 1e-9);
    EXPECT_EQ(result.locations[1].visits, 1u);

    EXPECT_NEAR(result.averageStopDurationMinutes, 40.0, 1e-9);
}

TEST_F(StopDetectorTest, InaccurateFixesAreIgnored) {
    std::vector<TrackingPoint> points;
    dwell(points, -26.2041, 28.0473, 0, 5);
    for (auto& point : points) {
        point.accuracy = 50.0;
    }

    EXPECT_TRUE(detector_.detectStops(points).stops.empty());
}

TEST_F(StopDetectorTest, ProductivityThresholds) {
    EXPECT_EQ(domain::StopDetector::productivityLabel(60.0), "High");
    EXPECT_EQ(domain::StopDetector::productivityLabel(59.9), "Medium");
    EXPECT_EQ(domain::StopDetector::productivityLabel(30.0), "Medium");
    EXPECT_EQ(domain::StopDetector::productivityLabel(15.0), "Low");
    EXPECT_EQ(domain::StopDetector::productivityLabel(14.9), "Minimal");
}
