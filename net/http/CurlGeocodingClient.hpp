#pragma once

#include "ports/IGeocodingClient.hpp"
#include "EngineConfig.hpp"
#include <string>

namespace triplog {

// Google Geocoding API reverse lookups over libcurl. Each call uses its own
// easy handle, so one instance may be shared by concurrent batch workers.
class CurlGeocodingClient : public ports::IGeocodingClient {
public:
    explicit CurlGeocodingClient(const GeocodingConfig& config);
    ~CurlGeocodingClient() override = default;

    CurlGeocodingClient(const CurlGeocodingClient&) = delete;
    CurlGeocodingClient& operator=(const CurlGeocodingClient&) = delete;

    ports::GeocodeResponse reverseGeocode(double lat, double lon) override;

    // Request URL for a coordinate, signed when a client secret is set.
    std::string buildRequestUrl(double lat, double lon) const;

    // Maps an HTTP status and Geocoding API body onto a GeocodeResponse.
    static ports::GeocodeResponse interpretResponse(long httpStatus, const std::string& body);

private:
    GeocodingConfig config_;
};

} // namespace triplog
