#include "TrackingPoint.hpp"

namespace triplog {

std::string warningTypeToString(WarningType type) {
    switch (type) {
        case WarningType::VirtualLocation: return "VIRTUAL_LOCATION";
        case WarningType::LowAccuracyGps: return "LOW_ACCURACY_GPS";
        case WarningType::RateLimitExceeded: return "RATE_LIMIT_EXCEEDED";
        case WarningType::GeocodingError: return "GEOCODING_ERROR";
    }
    return "UNKNOWN";
}

std::string ingestErrorKindToString(IngestErrorKind kind) {
    switch (kind) {
        case IngestErrorKind::None: return "none";
        case IngestErrorKind::InvalidInput: return "invalid_input";
        case IngestErrorKind::UnknownOwner: return "unknown_owner";
        case IngestErrorKind::Persistence: return "persistence";
    }
    return "unknown";
}

} // namespace triplog
