#include "MockGeocodingClient.hpp"

namespace triplog::sim {

ports::GeocodeResponse MockGeocodingClient::reverseGeocode(double lat, double lon) {
    Responder responder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(GeocodeCall{lat, lon});

        if (!queued_.empty()) {
            auto response = queued_.front();
            queued_.pop_front();
            return response;
        }
        responder = responder_;
    }

    if (responder) {
        return responder(lat, lon);
    }
    return ok("Street near " + Geo::fallbackAddress(lat, lon));
}

void MockGeocodingClient::queueResponse(const ports::GeocodeResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    queued_.push_back(response);
}

void MockGeocodingClient::setResponder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

void MockGeocodingClient::failAlways(ports::GeocodeStatus failure, const std::string& message) {
    setResponder([failure, message](double, double) {
        return status(failure, message);
    });
}

size_t MockGeocodingClient::callCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

std::vector<GeocodeCall> MockGeocodingClient::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

bool MockGeocodingClient::wasCalledNear(double lat, double lon, double toleranceMeters) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& call : calls_) {
        if (Geo::distanceMeters(call.lat, call.lon, lat, lon) <= toleranceMeters) return true;
    }
    return false;
}

void MockGeocodingClient::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    queued_.clear();
    responder_ = nullptr;
    calls_.clear();
}

ports::GeocodeResponse MockGeocodingClient::ok(const std::string& address) {
    ports::GeocodeResponse response;
    response.status = ports::GeocodeStatus::Ok;
    response.httpStatus = 200;
    response.address = address;
    return response;
}

ports::GeocodeResponse MockGeocodingClient::status(ports::GeocodeStatus status, const std::string& message) {
    ports::GeocodeResponse response;
    response.status = status;
    response.message = message;
    switch (status) {
        case ports::GeocodeStatus::RateLimited: response.httpStatus = 429; break;
        case ports::GeocodeStatus::TransportError: response.httpStatus = 503; break;
        default: response.httpStatus = 200; break;
    }
    return response;
}

} // namespace triplog::sim
