#pragma once

#include "../ports/IGeocodingClient.hpp"
#include "../Geo.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace triplog::sim {

struct GeocodeCall {
    double lat = 0.0;
    double lon = 0.0;
};

// Scripted geocoder. Queued responses are consumed first, then the responder
// (if set), then a default address derived from the coordinates.
class MockGeocodingClient : public ports::IGeocodingClient {
public:
    using Responder = std::function<ports::GeocodeResponse(double lat, double lon)>;

    MockGeocodingClient() = default;
    ~MockGeocodingClient() override = default;

    ports::GeocodeResponse reverseGeocode(double lat, double lon) override;

    void queueResponse(const ports::GeocodeResponse& response);
    void setResponder(Responder responder);
    void failAlways(ports::GeocodeStatus status, const std::string& message = "simulated failure");

    size_t callCount() const;
    std::vector<GeocodeCall> calls() const;
    bool wasCalledNear(double lat, double lon, double toleranceMeters = 1.0) const;
    void reset();

    static ports::GeocodeResponse ok(const std::string& address);
    static ports::GeocodeResponse status(ports::GeocodeStatus status, const std::string& message = "");

private:
    std::deque<ports::GeocodeResponse> queued_;
    Responder responder_;
    std::vector<GeocodeCall> calls_;
    mutable std::mutex mutex_;
};

} // namespace triplog::sim
