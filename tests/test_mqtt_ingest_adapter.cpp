#include <gtest/gtest.h>
#include "../core/adapters/MqttIngestAdapter.hpp"
#include "../core/adapters/InMemoryCacheStore.hpp"
#include "../core/adapters/InMemoryTrackingRepository.hpp"
#include "../core/adapters/InMemoryUserDirectory.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <nlohmann/json.hpp>
#include <memory>

using namespace triplog;
using namespace std::chrono_literals;

class MqttIngestAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        cache_ = std::make_shared<adapters::InMemoryCacheStore>(clock_);
        repository_ = std::make_shared<adapters::InMemoryTrackingRepository>();
        directory_ = std::make_shared<adapters::InMemoryUserDirectory>();
        eventBus_ = std::make_shared<domain::EventBus>();
        mqttClient_ = std::make_shared<sim::MockMqttClient>();

        ports::OwnerProfile owner;
        owner.id = 42;
        owner.name = "Thandi Mokoena";
        directory_->addOwner(owner);

        pipeline_ = std::make_shared<domain::IngestionPipeline>(repository_, directory_, cache_, eventBus_, clock_);

        config_.clientId = "triplog-test";
        config_.qos = 1;
        adapter_ = std::make_unique<adapters::MqttIngestAdapter>(mqttClient_, pipeline_, config_);
    }

    nlohmann::json lastAck() {
        const auto& published = mqttClient_->getPublishedMessages();
        EXPECT_FALSE(published.empty());
        if (published.empty()) return nullptr;
        return nlohmann::json::parse(published.back().payload);
    }

    MqttConfig config_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryCacheStore> cache_;
    std::shared_ptr<adapters::InMemoryTrackingRepository> repository_;
    std::shared_ptr<adapters::InMemoryUserDirectory> directory_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::shared_ptr<sim::MockMqttClient> mqttClient_;
    std::shared_ptr<domain::IngestionPipeline> pipeline_;
    std::unique_ptr<adapters::MqttIngestAdapter> adapter_;
};

TEST_F(MqttIngestAdapterTest, TopicParsing) {
    EXPECT_EQ(adapters::MqttIngestAdapter::ownerFromTopic("tracking/42/location"), OwnerId{42});
    EXPECT_FALSE(adapters::MqttIngestAdapter::ownerFromTopic("tracking/abc/location").has_value());
    EXPECT_FALSE(adapters::MqttIngestAdapter::ownerFromTopic("tracking//location").has_value());
    EXPECT_FALSE(adapters::MqttIngestAdapter::ownerFromTopic("tracking/42/location/ack").has_value());
    EXPECT_FALSE(adapters::MqttIngestAdapter::ownerFromTopic("devices/42/location").has_value());
    EXPECT_EQ(adapters::MqttIngestAdapter::ackTopic(42), "tracking/42/location/ack");
}

TEST_F(MqttIngestAdapterTest, StartConnectsAndSubscribes) {
    ASSERT_TRUE(adapter_->start());

    EXPECT_TRUE(adapter_->isRunning());
    ASSERT_TRUE(mqttClient_->lastOptions().has_value());
    EXPECT_EQ(mqttClient_->lastOptions()->clientId, "triplog-test");
    EXPECT_FALSE(mqttClient_->lastOptions()->tls.has_value());

    const auto& subscriptions = mqttClient_->getSubscriptions();
    ASSERT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(subscriptions[0], "tracking/+/location");
}

TEST_F(MqttIngestAdapterTest, TlsSettingsArePassedThrough) {
    config_.useTls = true;
    config_.caPath = "/etc/triplog/ca.pem";
    adapter_.reset();
    adapter_ = std::make_unique<adapters::MqttIngestAdapter>(mqttClient_, pipeline_, config_);

    ASSERT_TRUE(adapter_->start());
    ASSERT_TRUE(mqttClient_->lastOptions()->tls.has_value());
    EXPECT_EQ(mqttClient_->lastOptions()->tls->caPath, "/etc/triplog/ca.pem");
}

TEST_F(MqttIngestAdapterTest, StoresSampleAndAcknowledges) {
    adapter_->start();
    mqttClient_->injectMessage("tracking/42/location",
                               R"({"latitude": -26.2041, "longitude": 28.0473, "accuracy": 7})");

    mqttClient_->processEvents();

    EXPECT_EQ(adapter_->receivedCount(), 1u);
    EXPECT_EQ(adapter_->storedCount(), 1u);
    EXPECT_EQ(repository_->size(), 1u);

    const auto& published = mqttClient_->getPublishedMessages();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].topic, "tracking/42/location/ack");
    EXPECT_EQ(published[0].qos, 1);

    auto ack = lastAck();
    EXPECT_TRUE(ack["stored"].get<bool>());
    EXPECT_EQ(ack["message"], "Location tracked successfully");
    EXPECT_EQ(ack["data"]["ownerId"].get<OwnerId>(), 42);
}

TEST_F(MqttIngestAdapterTest, DiscardedSampleIsAcknowledgedWithWarning) {
    adapter_->start();
    mqttClient_->injectMessage("tracking/42/location",
                               R"({"latitude": -26.2041, "longitude": 28.0473, "accuracy": 60})");
    mqttClient_->processEvents();

    EXPECT_EQ(adapter_->rejectedCount(), 1u);
    auto ack = lastAck();
    EXPECT_FALSE(ack["stored"].get<bool>());
    EXPECT_EQ(ack["warnings"][0]["type"], "LOW_ACCURACY_GPS");
    EXPECT_FALSE(ack.contains("error"));
}

TEST_F(MqttIngestAdapterTest, OwnerMismatchIsRejected) {
    adapter_->start();
    mqttClient_->injectMessage("tracking/42/location",
                               R"({"userId": 43, "latitude": -26.2041, "longitude": 28.0473, "accuracy": 7})");
    mqttClient_->processEvents();

    EXPECT_EQ(repository_->size(), 0u);
    auto ack = lastAck();
    EXPECT_EQ(ack["error"]["kind"], "invalid_input");
    EXPECT_EQ(ack["error"]["message"], "Owner in payload does not match topic");
    EXPECT_EQ(mqttClient_->getPublishedMessages().back().topic, "tracking/42/location/ack");
}

TEST_F(MqttIngestAdapterTest, MalformedPayloadIsRejected) {
    adapter_->start();
    mqttClient_->injectMessage("tracking/42/location", "not json");
    mqttClient_->processEvents();

    EXPECT_EQ(adapter_->rejectedCount(), 1u);
    auto ack = lastAck();
    EXPECT_EQ(ack["error"]["kind"], "invalid_input");
}

TEST_F(MqttIngestAdapterTest, MessageWithoutAnyOwnerIsNotAcknowledged) {
    adapter_->start();
    MqttMessage message;
    message.topic = "fleet/location";
    message.payload = R"({"latitude": -26.2041, "longitude": 28.0473, "accuracy": 7})";

    auto result = adapter_->handleMessage(message);

    EXPECT_EQ(result.errorKind, IngestErrorKind::InvalidInput);
    EXPECT_TRUE(mqttClient_->getPublishedMessages().empty());
}

TEST_F(MqttIngestAdapterTest, ResubscribesAfterReconnect) {
    adapter_->start();
    mqttClient_->simulateConnectionLoss();
    mqttClient_->simulateConnectionRestore();

    ASSERT_EQ(mqttClient_->getSubscriptions().size(), 1u);
    EXPECT_TRUE(mqttClient_->isConnected());
}

TEST_F(MqttIngestAdapterTest, StopUnsubscribesAndDisconnects) {
    adapter_->start();
    adapter_->stop();

    EXPECT_FALSE(adapter_->isRunning());
    EXPECT_FALSE(mqttClient_->isConnected());
    EXPECT_TRUE(mqttClient_->getSubscriptions().empty());
}

TEST_F(MqttIngestAdapterTest, AckFailureDoesNotLoseTheSample) {
    adapter_->start();
    mqttClient_->setFailPublish(true);
    mqttClient_->injectMessage("tracking/42/location",
                               R"({"latitude": -26.2041, "longitude": 28.0473, "accuracy": 7})");
    mqttClient_->processEvents();

    EXPECT_EQ(adapter_->storedCount(), 1u);
    EXPECT_EQ(repository_->size(), 1u);
    EXPECT_TRUE(mqttClient_->getPublishedMessages().empty());
}
