#pragma once

#include <string>

namespace triplog::ports {

enum class GeocodeStatus {
    Ok,
    ZeroResults,
    RateLimited,     // HTTP 429 or OVER_QUERY_LIMIT, retryable
    Rejected,        // definitive API refusal, not retried
    TransportError   // timeout, network or 5xx, retryable
};

struct GeocodeResponse {
    GeocodeStatus status = GeocodeStatus::TransportError;
    int httpStatus = 0;
    std::string address;
    std::string message;
};

// One reverse-geocoding request; retries belong to the caller.
class IGeocodingClient {
public:
    virtual ~IGeocodingClient() = default;

    virtual GeocodeResponse reverseGeocode(double lat, double lon) = 0;
};

} // namespace triplog::ports
