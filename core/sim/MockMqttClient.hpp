#pragma once

#include "../IMqttClient.hpp"
#include <queue>
#include <vector>
#include <string>
#include <chrono>
#include <optional>

namespace triplog::sim {

struct PublishedMessage {
    std::string topic;
    std::string payload;
    int qos;
    bool retained;
    std::chrono::steady_clock::time_point timestamp;
};

// In-process broker stand-in. Inbound messages are queued by
// injectMessage and delivered on processEvents.
class MockMqttClient : public IMqttClient {
public:
    MockMqttClient();
    ~MockMqttClient() override = default;

    // IMqttClient interface
    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    void processEvents() override;

    // Mock-specific methods for testing
    void setConnected(bool connected);
    void simulateConnectionLoss();
    void simulateConnectionRestore();
    void injectMessage(const std::string& topic, const std::string& payload, int qos = 1);

    const std::vector<PublishedMessage>& getPublishedMessages() const { return publishedMessages_; }
    void clearPublishedMessages() { publishedMessages_.clear(); }
    const std::vector<std::string>& getSubscriptions() const { return subscriptions_; }
    const std::optional<MqttConnectOptions>& lastOptions() const { return lastOptions_; }

    bool shouldFailPublish() const { return failPublish_; }
    void setFailPublish(bool fail) { failPublish_ = fail; }

private:
    bool connected_ = false;
    bool failPublish_ = false;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::vector<PublishedMessage> publishedMessages_;
    std::queue<MqttMessage> incomingMessages_;
    std::vector<std::string> subscriptions_;

    std::optional<MqttConnectOptions> lastOptions_;
};

} // namespace triplog::sim
