#pragma once

#include "IClock.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace triplog {

using OwnerId = int64_t;
using PointId = int64_t;

struct Scope {
    std::optional<int64_t> organizationId;
    std::optional<int64_t> branchId;
};

// Present on points recorded as explicit stop events rather than raw GPS fixes.
struct StopMarker {
    TimePoint startTime;
    TimePoint endTime;
    int64_t durationMinutes = 0;
};

struct TrackingPoint {
    PointId id = 0;
    OwnerId ownerId = 0;

    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> accuracy;
    std::optional<double> speed;
    std::optional<double> heading;
    std::optional<double> altitude;
    std::optional<double> altitudeAccuracy;

    TimePoint capturedAt;
    TimePoint receivedAt;
    int64_t deviceTimestampMs = 0;

    std::optional<std::string> address;
    std::optional<std::string> addressError;
    std::string rawLocation;

    Scope scope;

    std::optional<TimePoint> deletedAt;
    std::optional<OwnerId> deletedBy;

    std::optional<StopMarker> stop;

    bool isDeleted() const { return deletedAt.has_value(); }
    bool hasAddress() const { return address.has_value() && !address->empty(); }
};

// Ingest input after flat/nested coordinate shapes have been normalised.
struct LocationSample {
    std::optional<OwnerId> ownerId;
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<double> accuracy;
    std::optional<double> speed;
    std::optional<double> heading;
    std::optional<double> altitude;
    std::optional<double> altitudeAccuracy;
    std::optional<double> timestampMs;
};

enum class WarningType {
    VirtualLocation,
    LowAccuracyGps,
    RateLimitExceeded,
    GeocodingError
};

std::string warningTypeToString(WarningType type);

struct Warning {
    WarningType type = WarningType::VirtualLocation;
    std::string message;
    std::map<std::string, std::string> details;
};

enum class IngestErrorKind {
    None,
    InvalidInput,
    UnknownOwner,
    Persistence
};

std::string ingestErrorKindToString(IngestErrorKind kind);

// stored == false with no error means the sample was filtered as expected
// noise; the reason is in warnings.
struct IngestResult {
    bool stored = false;
    std::string message;
    std::optional<TrackingPoint> data;
    std::vector<Warning> warnings;
    IngestErrorKind errorKind = IngestErrorKind::None;
    std::string errorMessage;

    bool isError() const { return errorKind != IngestErrorKind::None; }
};

} // namespace triplog
