/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for device location ingestion
 *
 * Platform-independent MQTT abstraction used by the ingestion listener to
 * receive location samples from field devices and publish acknowledgements.
 * Supports plain TCP brokers and TLS with optional client certificates.
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <optional>
#include <cstdint>

namespace triplog {

/**
 * @brief A single MQTT message, inbound or outbound
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "tracking/42/location"
    std::string payload;            ///< JSON location sample or acknowledgement
    int qos = 0;                    ///< 0, 1 or 2
    bool retained = false;
};

/**
 * @brief TLS settings for brokers that require encrypted transport
 *
 * @note Certificate and key files must be PEM encoded
 * @note certPath and keyPath may be left empty when the broker does not
 *       use client certificates
 */
struct TlsConfig {
    std::string caPath;            ///< Trusted root CA (.pem)
    std::string certPath;          ///< Client certificate (.pem), optional
    std::string keyPath;           ///< Client private key (.pem), optional
    bool verifyServer = true;
};

/**
 * @brief Broker connection parameters
 */
struct MqttConnectOptions {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;
    std::optional<TlsConfig> tls;  ///< Plain TCP when absent
};

/**
 * @brief Platform-independent MQTT client interface
 *
 * @note Callbacks may be invoked from the client library's own thread
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Start connecting to the broker
     * @return true if the connection attempt was initiated
     * @note Completion is reported through the connection callback
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish a message
     * @return true if handed to the broker; messages published while
     *         offline are queued and false is returned
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos = 0, bool retained = false) = 0;

    /**
     * @brief Subscribe to a topic filter (wildcards allowed)
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /**
     * @brief Pump pending work for implementations without their own thread
     */
    virtual void processEvents() = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace triplog
