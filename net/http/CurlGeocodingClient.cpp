#include "CurlGeocodingClient.hpp"
#include "Geo.hpp"
#include "Log.hpp"
#include "UrlSigner.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <stdexcept>

namespace triplog {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t totalSize = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

ports::GeocodeResponse makeResponse(ports::GeocodeStatus status, long httpStatus,
                                    const std::string& message) {
    ports::GeocodeResponse response;
    response.status = status;
    response.httpStatus = static_cast<int>(httpStatus);
    response.message = message;
    return response;
}

} // namespace

CurlGeocodingClient::CurlGeocodingClient(const GeocodingConfig& config)
    : config_(config) {
    ensureCurlInitialized();
}

std::string CurlGeocodingClient::buildRequestUrl(double lat, double lon) const {
    std::string url = config_.endpoint +
                      "?latlng=" + UrlSigner::urlEncode(Geo::formatCoordinate(lat) + "," + Geo::formatCoordinate(lon)) +
                      "&key=" + UrlSigner::urlEncode(config_.apiKey);

    if (!config_.clientSecret.empty()) {
        url = UrlSigner::signUrl(url, config_.clientSecret);
    }
    return url;
}

ports::GeocodeResponse CurlGeocodingClient::reverseGeocode(double lat, double lon) {
    using ports::GeocodeStatus;

    if (config_.apiKey.empty()) {
        return makeResponse(GeocodeStatus::Rejected, 0, "Geocoding API key not configured");
    }

    std::string url;
    try {
        url = buildRequestUrl(lat, lon);
    } catch (const std::invalid_argument& e) {
        return makeResponse(GeocodeStatus::Rejected, 0, e.what());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return makeResponse(GeocodeStatus::TransportError, 0, "Failed to initialize CURL");
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "triplog/1.0");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        Log::warn("Geocode", "Request failed: " + error);
        return makeResponse(GeocodeStatus::TransportError, 0, error);
    }

    return interpretResponse(httpCode, body);
}

ports::GeocodeResponse CurlGeocodingClient::interpretResponse(long httpStatus, const std::string& body) {
    using ports::GeocodeStatus;

    if (httpStatus == 429) {
        return makeResponse(GeocodeStatus::RateLimited, httpStatus, "HTTP 429 Too Many Requests");
    }
    if (httpStatus >= 500) {
        return makeResponse(GeocodeStatus::TransportError, httpStatus,
                            "HTTP " + std::to_string(httpStatus));
    }
    if (httpStatus != 200) {
        return makeResponse(GeocodeStatus::Rejected, httpStatus,
                            "Geocoding API error: HTTP " + std::to_string(httpStatus));
    }

    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return makeResponse(GeocodeStatus::TransportError, httpStatus, "Malformed geocoding response");
    }

    const std::string status = json.value("status", std::string());
    if (status == "OK") {
        const auto results = json.find("results");
        if (results != json.end() && results->is_array() && !results->empty()) {
            const auto& first = results->front();
            if (first.contains("formatted_address") && first["formatted_address"].is_string()) {
                ports::GeocodeResponse response = makeResponse(GeocodeStatus::Ok, httpStatus, "");
                response.address = first["formatted_address"].get<std::string>();
                return response;
            }
        }
        return makeResponse(GeocodeStatus::ZeroResults, httpStatus, "No formatted address in response");
    }
    if (status == "ZERO_RESULTS") {
        return makeResponse(GeocodeStatus::ZeroResults, httpStatus, "ZERO_RESULTS");
    }
    if (status == "OVER_QUERY_LIMIT") {
        return makeResponse(GeocodeStatus::RateLimited, httpStatus, "OVER_QUERY_LIMIT");
    }
    if (status == "UNKNOWN_ERROR") {
        return makeResponse(GeocodeStatus::TransportError, httpStatus, "UNKNOWN_ERROR");
    }

    std::string message = "Geocoding API error: " + (status.empty() ? std::string("missing status") : status);
    if (json.contains("error_message") && json["error_message"].is_string()) {
        message += " (" + json["error_message"].get<std::string>() + ")";
    }
    return makeResponse(GeocodeStatus::Rejected, httpStatus, message);
}

} // namespace triplog
