#include "MockMqttClient.hpp"
#include <algorithm>

namespace triplog::sim {

MockMqttClient::MockMqttClient() = default;

bool MockMqttClient::connect(const MqttConnectOptions& options) {
    lastOptions_ = options;
    connected_ = true;

    if (connectionCallback_) {
        connectionCallback_(true, "Mock connection established");
    }
    return true;
}

void MockMqttClient::disconnect() {
    if (connected_) {
        connected_ = false;
        if (connectionCallback_) {
            connectionCallback_(false, "Disconnected");
        }
    }
}

bool MockMqttClient::isConnected() const {
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (!connected_ || failPublish_) {
        return false;
    }

    PublishedMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;
    msg.timestamp = std::chrono::steady_clock::now();

    publishedMessages_.push_back(msg);
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    if (!connected_) return false;

    if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
        subscriptions_.push_back(topic);
    }
    return true;
}

bool MockMqttClient::unsubscribe(const std::string& topic) {
    if (!connected_) return false;

    auto it = std::find(subscriptions_.begin(), subscriptions_.end(), topic);
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::processEvents() {
    while (!incomingMessages_.empty()) {
        MqttMessage msg = incomingMessages_.front();
        incomingMessages_.pop();
        if (messageCallback_) {
            messageCallback_(msg);
        }
    }
}

void MockMqttClient::setConnected(bool connected) {
    bool wasConnected = connected_;
    connected_ = connected;

    if (connectionCallback_ && wasConnected != connected) {
        connectionCallback_(connected, connected ? "Connected" : "Disconnected");
    }
}

void MockMqttClient::simulateConnectionLoss() {
    setConnected(false);
}

void MockMqttClient::simulateConnectionRestore() {
    setConnected(true);
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload, int qos) {
    MqttMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = false;

    incomingMessages_.push(msg);
}

} // namespace triplog::sim
