#include "Geo.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace triplog {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceKm(double lat1, double lon1, double lat2, double lon2) {
    return distanceMeters(lat1, lon1, lat2, lon2) / 1000.0;
}

double Geo::distanceKm(const Coordinate& a, const Coordinate& b) {
    return distanceKm(a.lat, a.lon, b.lat, b.lon);
}

bool Geo::isValidLatitude(double lat) {
    return std::isfinite(lat) && lat >= -90.0 && lat <= 90.0;
}

bool Geo::isValidLongitude(double lon) {
    return std::isfinite(lon) && lon >= -180.0 && lon <= 180.0;
}

double Geo::roundTo(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

std::string Geo::formatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    std::string out = ss.str();
    // "-0.0000" reads as a different bucket than "0.0000"
    if (out.size() > 1 && out[0] == '-' && out.find_first_not_of("-0.") == std::string::npos) {
        out.erase(0, 1);
    }
    return out;
}

std::string Geo::fallbackAddress(double lat, double lon) {
    return formatFixed(lat, 4) + ", " + formatFixed(lon, 4);
}

std::string Geo::formatCoordinate(double value) {
    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    return ss.str();
}

std::string Geo::rawLocation(double lat, double lon) {
    return formatCoordinate(lat) + "," + formatCoordinate(lon);
}

std::string Geo::formatDistance(double km) {
    if (km < 1.0) {
        return std::to_string(static_cast<long long>(std::llround(km * 1000.0))) + " meters";
    }
    return formatFixed(km, 2) + " km";
}

std::string Geo::formatDuration(int64_t minutes) {
    if (minutes < 60) {
        return std::to_string(minutes) + "m";
    }
    return std::to_string(minutes / 60) + "h " + std::to_string(minutes % 60) + "m";
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

} // namespace triplog
