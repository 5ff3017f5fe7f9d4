#include <gtest/gtest.h>
#include "../core/Geo.hpp"
#include <limits>

using namespace triplog;

TEST(GeoTest, DistanceIsZeroForSamePoint) {
    EXPECT_DOUBLE_EQ(Geo::distanceMeters(-26.2041, 28.0473, -26.2041, 28.0473), 0.0);
}

TEST(GeoTest, DistanceIsSymmetric) {
    double ab = Geo::distanceKm(-26.2041, 28.0473, -25.7479, 28.2293);
    double ba = Geo::distanceKm(-25.7479, 28.2293, -26.2041, 28.0473);
    EXPECT_NEAR(ab, ba, 1e-9);
    // Johannesburg to Pretoria
    EXPECT_NEAR(ab, 53.9, 1.0);
}

TEST(GeoTest, OneDegreeOfLongitudeAtEquator) {
    EXPECT_NEAR(Geo::distanceKm(Coordinate{0.0, 0.0}, Coordinate{0.0, 1.0}), 111.195, 0.01);
}

TEST(GeoTest, CoordinateRanges) {
    EXPECT_TRUE(Geo::isValidLatitude(90.0));
    EXPECT_TRUE(Geo::isValidLatitude(-90.0));
    EXPECT_FALSE(Geo::isValidLatitude(90.0001));
    EXPECT_TRUE(Geo::isValidLongitude(-180.0));
    EXPECT_FALSE(Geo::isValidLongitude(180.5));
    EXPECT_FALSE(Geo::isValidLatitude(std::numeric_limits<double>::quiet_NaN()));
}

TEST(GeoTest, FallbackAddressUsesFourDecimals) {
    EXPECT_EQ(Geo::fallbackAddress(-26.20412, 28.04731), "-26.2041, 28.0473");
}

TEST(GeoTest, NegativeZeroFormatsAsZero) {
    EXPECT_EQ(Geo::formatFixed(-0.00001, 4), "0.0000");
    EXPECT_EQ(Geo::formatFixed(-0.5, 1), "-0.5");
}

TEST(GeoTest, RawLocationKeepsFullPrecision) {
    EXPECT_EQ(Geo::rawLocation(-26.2041, 28.0473), "-26.2041,28.0473");
}

TEST(GeoTest, FormatDistance) {
    EXPECT_EQ(Geo::formatDistance(0.35), "350 meters");
    EXPECT_EQ(Geo::formatDistance(12.5), "12.50 km");
}

TEST(GeoTest, FormatDuration) {
    EXPECT_EQ(Geo::formatDuration(45), "45m");
    EXPECT_EQ(Geo::formatDuration(60), "1h 0m");
    EXPECT_EQ(Geo::formatDuration(125), "2h 5m");
}
