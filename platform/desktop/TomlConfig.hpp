/**
 * @file TomlConfig.hpp
 * @brief TOML configuration loader for the triplog engine
 *
 * Simple line-based TOML parser producing an EngineConfig. Only flat
 * "key = value" pairs inside section headers are supported; arrays and
 * inline tables are not needed by any setting.
 *
 * Supported Sections:
 * - [geocoding]: API credentials, retry and backfill batching
 * - [rate_limit]: per-owner sample budget
 * - [validation]: accuracy ceiling and virtual-location filter
 * - [trip]: segment filters and trip break threshold
 * - [stops]: stop radius and minimum dwell
 * - [analytics]: report cache lifetime and insight thresholds
 * - [mqtt]: ingestion listener broker settings
 * - [logging]: minimum log level
 *
 * Environment variables override file values: GOOGLE_MAPS_API_KEY,
 * GOOGLE_MAPS_CLIENT_SECRET, MQTT_HOST, MQTT_PORT, TRIPLOG_LOG_LEVEL.
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <functional>
#include <stdexcept>
#include <filesystem>
#include <cstdlib>
#include "EngineConfig.hpp"
#include "Log.hpp"

namespace triplog {

/**
 * @brief TOML configuration file parser and validator
 *
 * Unknown keys are logged and ignored. Malformed values raise
 * std::runtime_error naming the offending key.
 */
class TomlConfig {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * @brief Load configuration from a TOML file
     * @throws std::runtime_error if the file cannot be read or a value is malformed
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        EngineConfig config = loadFromString(buffer.str());
        validateCertificatePaths(config.mqtt);
        return config;
    }

    /**
     * @brief Parse configuration text, starting from the built-in defaults
     */
    static EngineConfig loadFromString(const std::string& text) {
        EngineConfig config;
        std::istringstream input(text);

        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                throw std::runtime_error("Malformed config line: " + line);
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (!applyKey(config, currentSection, key, value)) {
                Log::warn("Config", "Ignoring unknown key [" + currentSection + "] " + key);
            }
        }

        return config;
    }

    /**
     * @brief Apply environment overrides on top of a loaded configuration
     * @param lookup Environment accessor, std::getenv by default
     */
    static void applyEnvironment(EngineConfig& config, const EnvLookup& lookup = defaultLookup) {
        if (const char* key = lookup("GOOGLE_MAPS_API_KEY")) {
            config.geocoding.apiKey = key;
        }
        if (const char* secret = lookup("GOOGLE_MAPS_CLIENT_SECRET")) {
            config.geocoding.clientSecret = secret;
        }
        if (const char* host = lookup("MQTT_HOST")) {
            config.mqtt.host = host;
        }
        if (const char* port = lookup("MQTT_PORT")) {
            config.mqtt.port = parsePort("MQTT_PORT", port);
        }
        if (const char* level = lookup("TRIPLOG_LOG_LEVEL")) {
            config.logLevel = level;
        }
    }

private:
    static const char* defaultLookup(const char* name) {
        return std::getenv(name);
    }

    static bool applyKey(EngineConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
        const std::string name = section + "." + key;

        if (section == "geocoding") {
            auto& g = config.geocoding;
            if (key == "api_key") g.apiKey = value;
            else if (key == "client_secret") g.clientSecret = value;
            else if (key == "endpoint") g.endpoint = value;
            else if (key == "timeout_ms") g.timeout = std::chrono::milliseconds(parseInt(name, value, 1));
            else if (key == "max_attempts") g.maxAttempts = parseInt(name, value, 1);
            else if (key == "retry_base_delay_ms") g.retryBaseDelay = std::chrono::milliseconds(parseInt(name, value, 0));
            else if (key == "cache_ttl_hours") g.cacheTtl = std::chrono::hours(parseInt(name, value, 1));
            else if (key == "cache_decimals") g.cacheDecimals = parseInt(name, value, 0);
            else if (key == "duplicate_distance_meters") g.duplicateDistanceMeters = parseDouble(name, value);
            else if (key == "duplicate_interval_minutes") g.duplicateInterval = std::chrono::minutes(parseInt(name, value, 0));
            else if (key == "group_radius_meters") g.groupRadiusMeters = parseDouble(name, value);
            else if (key == "batch_size") g.batchSize = static_cast<size_t>(parseInt(name, value, 1));
            else if (key == "batch_pause_ms") g.batchPause = std::chrono::milliseconds(parseInt(name, value, 0));
            else if (key == "max_consecutive_failures") g.maxConsecutiveFailures = parseInt(name, value, 1);
            else if (key == "bulk_limit") g.bulkLimit = static_cast<size_t>(parseInt(name, value, 1));
            else return false;
        } else if (section == "rate_limit") {
            if (key == "max_points") config.rateLimit.maxPoints = parseInt(name, value, 1);
            else if (key == "window_seconds") config.rateLimit.window = std::chrono::seconds(parseInt(name, value, 1));
            else return false;
        } else if (section == "validation") {
            auto& v = config.validation;
            if (key == "max_accuracy_meters") v.maxAccuracyMeters = parseDouble(name, value);
            else if (key == "require_accuracy") v.requireAccuracy = parseBool(name, value);
            else if (key == "virtual_marker") v.virtualMarker = value;
            else if (key == "reject_virtual") v.rejectVirtual = parseBool(name, value);
            else return false;
        } else if (section == "trip") {
            auto& t = config.trip;
            if (key == "min_interval_seconds") t.minInterval = std::chrono::seconds(parseInt(name, value, 0));
            else if (key == "min_distance_meters") t.minDistanceMeters = parseDouble(name, value);
            else if (key == "max_speed_kmh") t.maxSpeedKmh = parseDouble(name, value);
            else if (key == "moving_speed_kmh") t.movingSpeedKmh = parseDouble(name, value);
            else if (key == "reported_moving_speed_kmh") t.reportedMovingSpeedKmh = parseDouble(name, value);
            else if (key == "trip_break_minutes") t.tripBreak = std::chrono::minutes(parseInt(name, value, 1));
            else return false;
        } else if (section == "stops") {
            if (key == "radius_meters") config.stops.radiusMeters = parseDouble(name, value);
            else if (key == "min_duration_minutes") config.stops.minDuration = std::chrono::minutes(parseInt(name, value, 0));
            else return false;
        } else if (section == "analytics") {
            auto& a = config.analytics;
            if (key == "report_cache_ttl_hours") a.reportCacheTtl = std::chrono::hours(parseInt(name, value, 1));
            else if (key == "route_savings_threshold_km") a.routeSavingsThresholdKm = parseDouble(name, value);
            else if (key == "long_distance_km") a.longDistanceKm = parseDouble(name, value);
            else if (key == "min_points_for_patterns") a.minPointsForPatterns = static_cast<size_t>(parseInt(name, value, 1));
            else if (key == "max_users_per_report") a.maxUsersPerReport = static_cast<size_t>(parseInt(name, value, 1));
            else if (key == "user_report_concurrency") a.userReportConcurrency = static_cast<size_t>(parseInt(name, value, 1));
            else return false;
        } else if (section == "mqtt") {
            auto& m = config.mqtt;
            if (key == "host") m.host = value;
            else if (key == "port") m.port = parsePort(name, value);
            else if (key == "client_id") m.clientId = value;
            else if (key == "username") m.username = value;
            else if (key == "password") m.password = value;
            else if (key == "topic_filter") m.topicFilter = value;
            else if (key == "qos") m.qos = parseInt(name, value, 0);
            else if (key == "use_tls") m.useTls = parseBool(name, value);
            else if (key == "ca_path") m.caPath = value;
            else if (key == "cert_path") m.certPath = value;
            else if (key == "key_path") m.keyPath = value;
            else return false;
            if (m.qos > 2) {
                throw std::runtime_error("Invalid value for " + name + ": QoS must be 0, 1 or 2");
            }
        } else if (section == "logging") {
            if (key == "level") {
                LogLevel parsed;
                if (!Log::parseLevel(value, parsed)) {
                    throw std::runtime_error("Invalid value for " + name + ": " + value);
                }
                config.logLevel = value;
            } else {
                return false;
            }
        } else {
            return false;
        }
        return true;
    }

    static int parseInt(const std::string& name, const std::string& value, int minimum) {
        size_t used = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value, &used);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for " + name + ": " + value);
        }
        if (used != value.size()) {
            throw std::runtime_error("Invalid integer for " + name + ": " + value);
        }
        if (parsed < minimum) {
            throw std::runtime_error("Value for " + name + " must be at least " + std::to_string(minimum));
        }
        return parsed;
    }

    static double parseDouble(const std::string& name, const std::string& value) {
        size_t used = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value, &used);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number for " + name + ": " + value);
        }
        if (used != value.size() || parsed < 0.0) {
            throw std::runtime_error("Invalid number for " + name + ": " + value);
        }
        return parsed;
    }

    static bool parseBool(const std::string& name, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::runtime_error("Invalid boolean for " + name + ": " + value);
    }

    static uint16_t parsePort(const std::string& name, const std::string& value) {
        int port = parseInt(name, value, 1);
        if (port > 65535) {
            throw std::runtime_error("Invalid port for " + name + ": " + value);
        }
        return static_cast<uint16_t>(port);
    }

    static void validateCertificatePaths(const MqttConfig& mqtt) {
        namespace fs = std::filesystem;
        if (!mqtt.useTls) {
            return;
        }

        if (!mqtt.caPath.empty() && !fs::exists(mqtt.caPath)) {
            Log::warn("Config", "CA certificate not found: " + mqtt.caPath);
        }
        if (!mqtt.certPath.empty() && !fs::exists(mqtt.certPath)) {
            Log::warn("Config", "Client certificate not found: " + mqtt.certPath);
        }
        if (!mqtt.keyPath.empty() && !fs::exists(mqtt.keyPath)) {
            Log::warn("Config", "Client private key not found: " + mqtt.keyPath);
        }
    }

    // '#' starts a comment unless it sits inside a quoted value.
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace triplog
