#include "LocationValidator.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace triplog::domain {

std::string verdictToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::Accept: return "accept";
        case Verdict::RejectVirtual: return "reject_virtual";
        case Verdict::RejectInaccurate: return "reject_inaccurate";
        case Verdict::RejectOutOfRange: return "reject_out_of_range";
    }
    return "unknown";
}

LocationValidator::LocationValidator(ValidationConfig config)
    : config_(std::move(config)) {
}

ValidationOutcome LocationValidator::validate(double lat, double lon, std::optional<double> accuracy) const {
    ValidationOutcome outcome;

    if (!Geo::isValidLatitude(lat) || !Geo::isValidLongitude(lon)) {
        outcome.verdict = Verdict::RejectOutOfRange;
        outcome.message = "Invalid coordinates: latitude must be within [-90, 90] and longitude within [-180, 180]";
        return outcome;
    }

    if (config_.rejectVirtual && isVirtual(lat, lon)) {
        outcome.verdict = Verdict::RejectVirtual;
        outcome.message = "Virtual location detected and ignored";

        Warning warning;
        warning.type = WarningType::VirtualLocation;
        warning.message = "Location appears to be virtual/simulated and was not stored";
        warning.details["latitude"] = Geo::formatCoordinate(lat);
        warning.details["longitude"] = Geo::formatCoordinate(lon);
        outcome.warning = warning;
        return outcome;
    }

    if (!hasAcceptableAccuracy(accuracy)) {
        outcome.verdict = Verdict::RejectInaccurate;
        outcome.message = "GPS accuracy too low, location not stored";

        Warning warning;
        warning.type = WarningType::LowAccuracyGps;
        if (accuracy) {
            std::ostringstream ss;
            ss << "GPS accuracy is " << *accuracy << "m (threshold " << config_.maxAccuracyMeters << "m)";
            warning.message = ss.str();
            warning.details["accuracy"] = Geo::formatFixed(*accuracy, 1);
        } else {
            warning.message = "GPS accuracy not reported";
        }
        warning.details["threshold"] = Geo::formatFixed(config_.maxAccuracyMeters, 1);
        outcome.warning = warning;
        return outcome;
    }

    return outcome;
}

bool LocationValidator::isVirtual(double lat, double lon) const {
    if (config_.virtualMarker.empty()) return false;
    return digitsOf(lat).find(config_.virtualMarker) != std::string::npos ||
           digitsOf(lon).find(config_.virtualMarker) != std::string::npos;
}

bool LocationValidator::hasAcceptableAccuracy(std::optional<double> accuracy) const {
    if (!accuracy) return !config_.requireAccuracy;
    return std::isfinite(*accuracy) && *accuracy <= config_.maxAccuracyMeters;
}

AccuracyFilterResult LocationValidator::filterByAccuracy(const std::vector<TrackingPoint>& points) const {
    AccuracyFilterResult result;
    for (const auto& point : points) {
        if (point.accuracy) {
            ++result.withAccuracy;
        } else {
            ++result.withoutAccuracy;
        }

        if (hasAcceptableAccuracy(point.accuracy)) {
            result.points.push_back(point);
        } else if (point.accuracy) {
            ++result.aboveThreshold;
        }
    }
    return result;
}

std::string LocationValidator::digitsOf(double value) {
    std::ostringstream ss;
    ss << std::setprecision(15) << std::fabs(value);
    std::string text = ss.str();

    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (c != '.') digits.push_back(c);
    }
    return digits;
}

} // namespace triplog::domain
