#pragma once

#include "Analytics.hpp"
#include "TrackingPoint.hpp"
#include "ports/IUserDirectory.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace triplog {

class JsonCodec {
public:
    // Accepts flat latitude/longitude or the same fields nested in "coords".
    // Numeric fields may be sent as numbers or numeric strings.
    // Throws std::invalid_argument when the text is not a JSON object.
    static LocationSample parseSample(const std::string& json);
    static LocationSample jsonToSample(const nlohmann::json& json);

    static nlohmann::json pointToJson(const TrackingPoint& point);
    static nlohmann::json warningToJson(const Warning& warning);
    static nlohmann::json ingestResultToJson(const IngestResult& result);
    static std::string serialize(const IngestResult& result);

    static nlohmann::json ownerToJson(const ports::OwnerProfile& owner);
    static ports::OwnerProfile jsonToOwner(const nlohmann::json& json);

    static nlohmann::json periodToJson(const Period& period);
    static nlohmann::json tripSummaryToJson(const TripSummary& trip);
    static nlohmann::json stopToJson(const Stop& stop);
    static nlohmann::json stopsToJson(const StopDetectionResult& stops);
    static nlohmann::json analyticsToJson(const PointAnalytics& analytics, const TripSegments& segments);
    static nlohmann::json insightsToJson(const Insights& insights);
    static nlohmann::json geocodingStatusToJson(const GeocodingStatus& status);
    static nlohmann::json backfillSummaryToJson(const BackfillSummary& summary);
    static nlohmann::json recalculationToJson(const RecalculationInfo& info);
    static nlohmann::json reportToJson(const TrackingReport& report);

    static double round1(double value);
    static double round2(double value);
    static int64_t roundWhole(double value);

private:
    static std::optional<double> numberField(const nlohmann::json& json, const char* key);
};

} // namespace triplog
