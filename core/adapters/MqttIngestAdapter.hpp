#pragma once

#include "../IMqttClient.hpp"
#include "../EngineConfig.hpp"
#include "../TrackingPoint.hpp"
#include "../domain/IngestionPipeline.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace triplog::adapters {

// Feeds location samples published on "tracking/<owner>/location" into the
// ingestion pipeline and answers each one on "tracking/<owner>/location/ack"
// with the serialized IngestResult. The owner segment of the topic is used
// when the payload carries no owner of its own.
class MqttIngestAdapter {
public:
    MqttIngestAdapter(std::shared_ptr<IMqttClient> mqttClient,
                      std::shared_ptr<domain::IngestionPipeline> pipeline,
                      const MqttConfig& config);
    ~MqttIngestAdapter();

    MqttIngestAdapter(const MqttIngestAdapter&) = delete;
    MqttIngestAdapter& operator=(const MqttIngestAdapter&) = delete;

    // Connects and subscribes once the broker accepts the connection.
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Handles one inbound message; exposed for the CLI's offline replay.
    IngestResult handleMessage(const MqttMessage& message);

    static std::optional<OwnerId> ownerFromTopic(const std::string& topic);
    static std::string ackTopic(OwnerId ownerId);

    uint64_t receivedCount() const { return received_; }
    uint64_t storedCount() const { return stored_; }
    uint64_t rejectedCount() const { return rejected_; }

private:
    void onConnection(bool connected, const std::string& reason);
    void sendAck(OwnerId ownerId, const IngestResult& result);
    static IngestResult invalidInput(const std::string& message);

    std::shared_ptr<IMqttClient> mqttClient_;
    std::shared_ptr<domain::IngestionPipeline> pipeline_;
    MqttConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> stored_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace triplog::adapters
