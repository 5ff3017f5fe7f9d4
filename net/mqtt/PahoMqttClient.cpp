#include "PahoMqttClient.hpp"
#include "Log.hpp"
#include <fstream>
#include <utility>

namespace triplog {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    const bool useTls = options.tls.has_value();

    if (useTls && !validateCertificateFiles(*options.tls)) {
        return false;
    }

    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    std::string serverURI = std::string(useTls ? "ssl://" : "tcp://") +
                            options.host + ":" + std::to_string(options.port);

    Log::info("MQTT", "Connecting to " + serverURI + " as " + options.clientId);

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), options.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        Log::error("MQTT", "Failed to create client, error code: " + std::to_string(rc));
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.retryInterval = 5;
    conn_opts.automaticReconnect = 1;
    conn_opts.minRetryInterval = 1;
    conn_opts.maxRetryInterval = 60;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    if (!options.username.empty()) {
        conn_opts.username = options.username.c_str();
    }
    if (!options.password.empty()) {
        conn_opts.password = options.password.c_str();
    }

    if (useTls) {
        const TlsConfig& tls = *options.tls;
        if (!tls.certPath.empty()) {
            ssl_opts.keyStore = tls.certPath.c_str();
        }
        if (!tls.keyPath.empty()) {
            ssl_opts.privateKey = tls.keyPath.c_str();
        }
        if (!tls.caPath.empty()) {
            ssl_opts.trustStore = tls.caPath.c_str();
        }
        ssl_opts.enableServerCertAuth = tls.verifyServer ? 1 : 0;
        ssl_opts.verify = tls.verifyServer ? 1 : 0;
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        Log::error("MQTT", "Connection attempt failed, error code: " + std::to_string(rc));
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            Log::warn("MQTT", "Disconnect failed, error code: " + std::to_string(rc));
        }
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (!connected_) {
        queueMessage(topic, payload, qos, retained);
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        Log::warn("MQTT", "Publish to " + topic + " failed, error code: " + std::to_string(rc));
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::processEvents() {
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    if (client->messageCallback_) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                                 : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload),
                                  static_cast<std::size_t>(message->payloadlen));
        msg.qos = message->qos;
        msg.retained = message->retained != 0;

        try {
            client->messageCallback_(msg);
        } catch (const std::exception& e) {
            Log::error("MQTT", "Message handler failed for " + msg.topic + ": " + e.what());
        }
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    Log::info("MQTT", "Connected");

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }

    client->flushOfflineQueue();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    Log::error("MQTT", reason);

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = cause ? std::string(cause) : "Connection lost";
    Log::warn("MQTT", reason);

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    Log::info("MQTT", "Disconnected");
}

void PahoMqttClient::flushOfflineQueue() {
    std::queue<MqttMessage> pending;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        std::swap(pending, offlineQueue_);
    }

    if (!pending.empty()) {
        Log::info("MQTT", "Flushing " + std::to_string(pending.size()) + " queued messages");
    }

    // Messages that fail while flushing are re-queued by publish().
    while (!pending.empty()) {
        const auto& msg = pending.front();
        publish(msg.topic, msg.payload, msg.qos, msg.retained);
        pending.pop();
    }
}

void PahoMqttClient::queueMessage(const std::string& topic, const std::string& payload,
                                  int qos, bool retained) {
    std::lock_guard<std::mutex> lock(queueMutex_);

    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        offlineQueue_.pop();
    }

    MqttMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;

    offlineQueue_.push(msg);
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    const std::pair<const char*, const std::string*> files[] = {
        {"CA file", &tlsConfig.caPath},
        {"Certificate file", &tlsConfig.certPath},
        {"Private key file", &tlsConfig.keyPath},
    };

    for (const auto& entry : files) {
        if (entry.second->empty()) {
            continue;
        }
        std::ifstream file(*entry.second);
        if (!file.good()) {
            Log::error("MQTT", std::string(entry.first) + " not found: " + *entry.second);
            return false;
        }
    }

    if (tlsConfig.certPath.empty() != tlsConfig.keyPath.empty()) {
        Log::error("MQTT", "Client certificate and private key must be configured together");
        return false;
    }
    return true;
}

} // namespace triplog
