#pragma once

#include <string>
#include <cstdint>

namespace triplog {

struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;
};

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceKm(double lat1, double lon1, double lat2, double lon2);
    static double distanceKm(const Coordinate& a, const Coordinate& b);

    static bool isValidLatitude(double lat);
    static bool isValidLongitude(double lon);

    // Rounds to a fixed number of decimals (4 decimals is an ~11 m bucket).
    static double roundTo(double value, int decimals);
    static std::string formatFixed(double value, int decimals);

    // "<lat>, <lon>" at 4 decimals, shown when no address could be resolved.
    static std::string fallbackAddress(double lat, double lon);
    // Shortest round-trippable form, e.g. -26.2041.
    static std::string formatCoordinate(double value);
    static std::string rawLocation(double lat, double lon);

    // "350 meters" below one kilometre, "12.34 km" otherwise.
    static std::string formatDistance(double km);
    // "45m" below one hour, "2h 5m" otherwise.
    static std::string formatDuration(int64_t minutes);

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
};

} // namespace triplog
