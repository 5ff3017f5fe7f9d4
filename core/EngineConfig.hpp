#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace triplog {

struct ValidationConfig {
    double maxAccuracyMeters = 20.0;
    bool requireAccuracy = true;
    // Digit run that marks coordinates produced by the test harness.
    std::string virtualMarker = "122";
    bool rejectVirtual = true;
};

struct RateLimitConfig {
    int maxPoints = 2;
    std::chrono::seconds window{60};
};

struct GeocodingConfig {
    std::string apiKey;
    std::string clientSecret;
    std::string endpoint = "https://maps.googleapis.com/maps/api/geocode/json";
    std::chrono::milliseconds timeout{5000};
    int maxAttempts = 3;
    std::chrono::milliseconds retryBaseDelay{1000};
    std::chrono::hours cacheTtl{24};
    int cacheDecimals = 4;

    // Backfill
    double duplicateDistanceMeters = 10.0;
    std::chrono::minutes duplicateInterval{5};
    double groupRadiusMeters = 88.8;
    size_t batchSize = 5;
    std::chrono::milliseconds batchPause{1000};
    int maxConsecutiveFailures = 3;
    size_t bulkLimit = 100;
};

struct TripConfig {
    std::chrono::seconds minInterval{5};
    double minDistanceMeters = 5.0;
    double maxSpeedKmh = 200.0;
    double movingSpeedKmh = 2.0;
    // Reported-speed threshold used by the per-point analytics block.
    double reportedMovingSpeedKmh = 1.0;
    std::chrono::minutes tripBreak{5};
};

struct StopConfig {
    double radiusMeters = 50.0;
    std::chrono::minutes minDuration{3};
};

struct AnalyticsConfig {
    std::chrono::hours reportCacheTtl{1};
    double routeSavingsThresholdKm = 2.0;
    double longDistanceKm = 50.0;
    size_t minPointsForPatterns = 10;
    size_t maxUsersPerReport = 100;
    size_t userReportConcurrency = 10;
};

struct MqttConfig {
    std::string host = "localhost";
    uint16_t port = 1883;
    std::string clientId = "triplog-ingest";
    std::string username;
    std::string password;
    std::string topicFilter = "tracking/+/location";
    int qos = 1;
    bool useTls = false;
    std::string caPath;
    std::string certPath;
    std::string keyPath;
};

struct EngineConfig {
    ValidationConfig validation;
    RateLimitConfig rateLimit;
    GeocodingConfig geocoding;
    TripConfig trip;
    StopConfig stops;
    AnalyticsConfig analytics;
    MqttConfig mqtt;
    std::string logLevel = "info";
};

} // namespace triplog
