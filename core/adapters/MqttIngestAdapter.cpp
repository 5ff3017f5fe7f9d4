#include "MqttIngestAdapter.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include <cctype>

namespace triplog::adapters {

namespace {
constexpr const char* kTopicRoot = "tracking/";
constexpr const char* kTopicLeaf = "/location";
}

MqttIngestAdapter::MqttIngestAdapter(std::shared_ptr<IMqttClient> mqttClient,
                                     std::shared_ptr<domain::IngestionPipeline> pipeline,
                                     const MqttConfig& config)
    : mqttClient_(std::move(mqttClient))
    , pipeline_(std::move(pipeline))
    , config_(config) {

    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        handleMessage(msg);
    });

    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onConnection(connected, reason);
    });
}

MqttIngestAdapter::~MqttIngestAdapter() {
    stop();
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

bool MqttIngestAdapter::start() {
    MqttConnectOptions options;
    options.host = config_.host;
    options.port = config_.port;
    options.clientId = config_.clientId;
    options.username = config_.username;
    options.password = config_.password;
    if (config_.useTls) {
        TlsConfig tls;
        tls.caPath = config_.caPath;
        tls.certPath = config_.certPath;
        tls.keyPath = config_.keyPath;
        options.tls = tls;
    }

    running_ = true;
    if (!mqttClient_->connect(options)) {
        running_ = false;
        Log::error("Listener", "Could not start MQTT connection to " + config_.host);
        return false;
    }
    return true;
}

void MqttIngestAdapter::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (mqttClient_->isConnected()) {
        mqttClient_->unsubscribe(config_.topicFilter);
        mqttClient_->disconnect();
    }
}

IngestResult MqttIngestAdapter::handleMessage(const MqttMessage& message) {
    ++received_;

    const auto topicOwner = ownerFromTopic(message.topic);

    IngestResult result;
    std::optional<OwnerId> ackOwner = topicOwner;
    try {
        LocationSample sample = JsonCodec::parseSample(message.payload);
        if (sample.ownerId && topicOwner && *sample.ownerId != *topicOwner) {
            result = invalidInput("Owner in payload does not match topic");
        } else {
            if (!sample.ownerId) {
                sample.ownerId = topicOwner;
            }
            ackOwner = sample.ownerId;
            result = pipeline_->ingest(sample);
        }
    } catch (const std::invalid_argument& e) {
        result = invalidInput(e.what());
    }

    if (result.stored) {
        ++stored_;
    } else {
        ++rejected_;
    }

    if (ackOwner) {
        sendAck(*ackOwner, result);
    } else {
        Log::warn("Listener", "No owner for message on " + message.topic + ", acknowledgement skipped");
    }
    return result;
}

std::optional<OwnerId> MqttIngestAdapter::ownerFromTopic(const std::string& topic) {
    const std::string root = kTopicRoot;
    const std::string leaf = kTopicLeaf;
    if (topic.size() <= root.size() + leaf.size() ||
        topic.compare(0, root.size(), root) != 0 ||
        topic.compare(topic.size() - leaf.size(), leaf.size(), leaf) != 0) {
        return std::nullopt;
    }

    const std::string segment = topic.substr(root.size(), topic.size() - root.size() - leaf.size());
    if (segment.empty() || segment.size() > 18) {
        return std::nullopt;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return static_cast<OwnerId>(std::stoll(segment));
}

std::string MqttIngestAdapter::ackTopic(OwnerId ownerId) {
    return std::string(kTopicRoot) + std::to_string(ownerId) + kTopicLeaf + "/ack";
}

void MqttIngestAdapter::onConnection(bool connected, const std::string& reason) {
    if (!connected) {
        Log::warn("Listener", "Broker connection down: " + reason);
        return;
    }
    if (!running_) {
        return;
    }
    if (mqttClient_->subscribe(config_.topicFilter, config_.qos)) {
        Log::info("Listener", "Subscribed to " + config_.topicFilter);
    } else {
        Log::error("Listener", "Subscribe to " + config_.topicFilter + " failed");
    }
}

void MqttIngestAdapter::sendAck(OwnerId ownerId, const IngestResult& result) {
    const std::string topic = ackTopic(ownerId);
    if (!mqttClient_->publish(topic, JsonCodec::serialize(result), config_.qos, false)) {
        Log::warn("Listener", "Acknowledgement on " + topic + " not delivered");
    }
}

IngestResult MqttIngestAdapter::invalidInput(const std::string& message) {
    Log::warn("Listener", "Rejected message: " + message);
    IngestResult result;
    result.stored = false;
    result.message = message;
    result.errorKind = IngestErrorKind::InvalidInput;
    result.errorMessage = message;
    return result;
}

} // namespace triplog::adapters
