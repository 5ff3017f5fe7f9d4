#include <gtest/gtest.h>
#include "CurlGeocodingClient.hpp"

using namespace triplog;
using ports::GeocodeStatus;

class CurlGeocodingClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.apiKey = "test-key";
        config_.endpoint = "https://maps.googleapis.com/maps/api/geocode/json";
    }

    GeocodingConfig config_;
};

TEST_F(CurlGeocodingClientTest, BuildsReverseGeocodeUrl) {
    CurlGeocodingClient client(config_);
    EXPECT_EQ(client.buildRequestUrl(-26.2041, 28.0473),
              "https://maps.googleapis.com/maps/api/geocode/json?latlng=-26.2041%2C28.0473&key=test-key");
}

TEST_F(CurlGeocodingClientTest, SignsUrlWhenSecretIsSet) {
    config_.clientSecret = "vNIXE0xscrmjlyV-12Nj_BvUPaw=";
    CurlGeocodingClient client(config_);

    auto url = client.buildRequestUrl(-26.2041, 28.0473);
    EXPECT_EQ(url.rfind("https://maps.googleapis.com/maps/api/geocode/json?latlng=", 0), 0u);
    EXPECT_NE(url.find("&signature="), std::string::npos);
}

TEST_F(CurlGeocodingClientTest, MissingApiKeyIsRejectedWithoutNetwork) {
    config_.apiKey.clear();
    CurlGeocodingClient client(config_);

    auto response = client.reverseGeocode(-26.2041, 28.0473);
    EXPECT_EQ(response.status, GeocodeStatus::Rejected);
    EXPECT_EQ(response.message, "Geocoding API key not configured");
}

TEST_F(CurlGeocodingClientTest, OkResponseYieldsFirstFormattedAddress) {
    auto response = CurlGeocodingClient::interpretResponse(200, R"({
        "status": "OK",
        "results": [
            {"formatted_address": "1 Commissioner St, Johannesburg, 2001, South Africa"},
            {"formatted_address": "Johannesburg, South Africa"}
        ]
    })");

    EXPECT_EQ(response.status, GeocodeStatus::Ok);
    EXPECT_EQ(response.address, "1 Commissioner St, Johannesburg, 2001, South Africa");
}

TEST_F(CurlGeocodingClientTest, OkWithoutAddressIsZeroResults) {
    auto response = CurlGeocodingClient::interpretResponse(200, R"({"status": "OK", "results": []})");
    EXPECT_EQ(response.status, GeocodeStatus::ZeroResults);
}

TEST_F(CurlGeocodingClientTest, ApiStatusMapping) {
    EXPECT_EQ(CurlGeocodingClient::interpretResponse(200, R"({"status": "ZERO_RESULTS", "results": []})").status,
              GeocodeStatus::ZeroResults);
    EXPECT_EQ(CurlGeocodingClient::interpretResponse(200, R"({"status": "OVER_QUERY_LIMIT"})").status,
              GeocodeStatus::RateLimited);
    EXPECT_EQ(CurlGeocodingClient::interpretResponse(200, R"({"status": "UNKNOWN_ERROR"})").status,
              GeocodeStatus::TransportError);

    auto denied = CurlGeocodingClient::interpretResponse(
        200, R"({"status": "REQUEST_DENIED", "error_message": "The provided API key is invalid."})");
    EXPECT_EQ(denied.status, GeocodeStatus::Rejected);
    EXPECT_EQ(denied.message, "Geocoding API error: REQUEST_DENIED (The provided API key is invalid.)");
}

TEST_F(CurlGeocodingClientTest, HttpStatusMapping) {
    EXPECT_EQ(CurlGeocodingClient::interpretResponse(429, "").status, GeocodeStatus::RateLimited);
    EXPECT_EQ(CurlGeocodingClient::interpretResponse(503, "").status, GeocodeStatus::TransportError);

    auto forbidden = CurlGeocodingClient::interpretResponse(403, "");
    EXPECT_EQ(forbidden.status, GeocodeStatus::Rejected);
    EXPECT_EQ(forbidden.message, "Geocoding API error: HTTP 403");
    EXPECT_EQ(forbidden.httpStatus, 403);
}

TEST_F(CurlGeocodingClientTest, MalformedBodyIsTransportError) {
    EXPECT_EQ(CurlGeocodingClient::interpretResponse(200, "<html>").status, GeocodeStatus::TransportError);
}
