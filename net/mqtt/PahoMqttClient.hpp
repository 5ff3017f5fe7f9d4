/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C client implementation
 *
 * Concrete IMqttClient on top of the Paho asynchronous C library. Used by
 * the ingestion listener to receive location samples from devices.
 *
 * Features:
 * - Plain TCP or TLS (with optional X.509 client certificates)
 * - Offline message queueing with automatic flush on reconnect
 * - Asynchronous operation on Paho's own thread
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <cstdint>

namespace triplog {

/**
 * @brief Paho-backed MQTT client
 *
 * Paho copies connection options during MQTTAsync_connect, so the option
 * strings only need to outlive that call. Callbacks run on the Paho thread.
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /**
     * @brief Disconnects if needed and destroys the Paho handle
     */
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    /**
     * @brief Create the Paho client and start an asynchronous connect
     *
     * Uses "tcp://host:port" without TLS settings and "ssl://host:port"
     * with them. Certificate files are checked before connecting.
     */
    bool connect(const MqttConnectOptions& options) override;

    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;

    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    /**
     * @brief No-op; Paho drives callbacks from its own thread
     */
    void processEvents() override;

private:
    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 100;

    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 30;

    MQTTAsync client_;
    std::atomic<bool> connected_{false};

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::queue<MqttMessage> offlineQueue_;
    std::mutex queueMutex_;

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);

    void flushOfflineQueue();

    /**
     * @brief Queue a message while offline, dropping the oldest when full
     */
    void queueMessage(const std::string& topic, const std::string& payload,
                      int qos, bool retained);

    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace triplog
