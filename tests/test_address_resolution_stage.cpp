#include <gtest/gtest.h>
#include "../core/domain/AddressResolutionStage.hpp"
#include "../core/domain/IngestionPipeline.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/InMemoryCacheStore.hpp"
#include "../core/adapters/InMemoryTrackingRepository.hpp"
#include "../core/adapters/InMemoryUserDirectory.hpp"
#include "../core/sim/MockGeocodingClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace triplog;
using namespace std::chrono_literals;

class AddressResolutionStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        cache_ = std::make_shared<adapters::InMemoryCacheStore>(clock_);
        repository_ = std::make_shared<adapters::InMemoryTrackingRepository>();
        directory_ = std::make_shared<adapters::InMemoryUserDirectory>();
        eventBus_ = std::make_shared<domain::EventBus>();
        geocoder_ = std::make_shared<sim::MockGeocodingClient>();
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>();

        ports::OwnerProfile owner;
        owner.id = 42;
        owner.name = "Thandi Mokoena";
        directory_->addOwner(owner);

        resolver_ = std::make_shared<domain::GeocodeResolver>(geocoder_, cache_, policyEngine_, clock_);
        pipeline_ = std::make_unique<domain::IngestionPipeline>(repository_, directory_, cache_, eventBus_, clock_);
        stage_ = std::make_unique<domain::AddressResolutionStage>(repository_, resolver_, eventBus_, cache_);

        eventBus_->subscribe(EventType::AddressResolved, [this](const Event& e) { resolved_.push_back(e); });
        eventBus_->subscribe(EventType::AddressResolutionFailed, [this](const Event& e) { failed_.push_back(e); });
        stage_->start();
    }

    PointId ingest(double lat, double lon) {
        LocationSample sample;
        sample.ownerId = 42;
        sample.lat = lat;
        sample.lon = lon;
        sample.accuracy = 6.0;
        auto result = pipeline_->ingest(sample);
        clock_->advance(61s);
        return result.data ? result.data->id : 0;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryCacheStore> cache_;
    std::shared_ptr<adapters::InMemoryTrackingRepository> repository_;
    std::shared_ptr<adapters::InMemoryUserDirectory> directory_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::shared_ptr<sim::MockGeocodingClient> geocoder_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
    std::shared_ptr<domain::GeocodeResolver> resolver_;
    std::unique_ptr<domain::IngestionPipeline> pipeline_;
    std::unique_ptr<domain::AddressResolutionStage> stage_;

    std::vector<Event> resolved_;
    std::vector<Event> failed_;
};

TEST_F(AddressResolutionStageTest, StoredPointIsResolvedLater) {
    PointId id = ingest(-26.2041, 28.0473);
    ASSERT_NE(id, 0);

    // Ingestion itself never calls the geocoder.
    EXPECT_EQ(geocoder_->callCount(), 0u);
    EXPECT_FALSE(repository_->get(id)->hasAddress());

    eventBus_->processEvents();
    EXPECT_EQ(stage_->pendingCount(), 1u);

    auto summary = stage_->processPending();
    EXPECT_EQ(summary.resolvedPoints, 1u);
    EXPECT_EQ(stage_->pendingCount(), 0u);
    EXPECT_TRUE(repository_->get(id)->hasAddress());

    eventBus_->processEvents();
    ASSERT_EQ(resolved_.size(), 1u);
    EXPECT_EQ(resolved_[0].pointId, id);
    EXPECT_EQ(resolved_[0].extras.at("address"), *repository_->get(id)->address);
}

TEST_F(AddressResolutionStageTest, FailedPointsWaitForRetry) {
    geocoder_->failAlways(ports::GeocodeStatus::TransportError, "offline");
    PointId id = ingest(-26.2041, 28.0473);
    eventBus_->processEvents();

    auto summary = stage_->processPending();
    EXPECT_EQ(summary.failedPoints, 1u);
    ASSERT_EQ(stage_->failedPoints().size(), 1u);
    EXPECT_EQ(stage_->failedPoints()[0], id);

    auto point = repository_->get(id);
    ASSERT_TRUE(point.has_value());
    EXPECT_FALSE(point->hasAddress());
    EXPECT_EQ(point->addressError, std::optional<std::string>("Geocoding failed: offline"));

    eventBus_->processEvents();
    ASSERT_EQ(failed_.size(), 1u);
    EXPECT_EQ(failed_[0].extras.at("error"), "Geocoding failed: offline");

    geocoder_->reset();
    auto retried = stage_->retryFailed();

    EXPECT_EQ(retried.resolvedPoints, 1u);
    EXPECT_TRUE(stage_->failedPoints().empty());
    EXPECT_TRUE(repository_->get(id)->hasAddress());
    EXPECT_FALSE(repository_->get(id)->addressError.has_value());
}

TEST_F(AddressResolutionStageTest, BatchSharesLookupsForNearbyPoints) {
    ingest(-26.2041, 28.0473);
    clock_->advance(10min);
    ingest(-26.20455, 28.0473);
    eventBus_->processEvents();

    auto summary = stage_->processPending();

    EXPECT_EQ(summary.resolvedPoints, 2u);
    EXPECT_EQ(geocoder_->callCount(), 1u);
}

TEST_F(AddressResolutionStageTest, DeletedPointIsSkipped) {
    PointId id = ingest(-26.2041, 28.0473);
    repository_->softDelete(id, 1, clock_->now());
    eventBus_->processEvents();

    auto summary = stage_->processPending();

    EXPECT_EQ(summary.candidates, 0u);
    EXPECT_EQ(geocoder_->callCount(), 0u);
    EXPECT_TRUE(stage_->failedPoints().empty());
}

TEST_F(AddressResolutionStageTest, ResolvingInvalidatesCachedReports) {
    cache_->set("timeframe:42:today", "{}", std::chrono::hours(1));
    ingest(-26.2041, 28.0473);
    cache_->set("timeframe:42:today", "{}", std::chrono::hours(1));
    eventBus_->processEvents();

    stage_->processPending();

    EXPECT_FALSE(cache_->get("timeframe:42:today").has_value());
}

TEST_F(AddressResolutionStageTest, StoppedStageIgnoresNewPoints) {
    stage_->stop();
    EXPECT_FALSE(stage_->isRunning());

    ingest(-26.2041, 28.0473);
    eventBus_->processEvents();

    EXPECT_EQ(stage_->pendingCount(), 0u);
}

TEST_F(AddressResolutionStageTest, DestroyedStageLeavesTheBus) {
    {
        domain::AddressResolutionStage scoped(repository_, resolver_, eventBus_, cache_);
        scoped.start();
        EXPECT_EQ(eventBus_->handlerCount(EventType::PointStored), 2u);
    }
    EXPECT_EQ(eventBus_->handlerCount(EventType::PointStored), 1u);

    ingest(-26.2041, 28.0473);
    eventBus_->processEvents();

    EXPECT_EQ(stage_->pendingCount(), 1u);
}

TEST_F(AddressResolutionStageTest, StopKeepsOtherSubscribers) {
    std::vector<Event> seen;
    eventBus_->subscribe(EventType::PointStored, [&seen](const Event& e) { seen.push_back(e); });

    stage_->stop();
    ingest(-26.2041, 28.0473);
    eventBus_->processEvents();

    EXPECT_EQ(seen.size(), 1u);
    EXPECT_EQ(stage_->pendingCount(), 0u);
    EXPECT_EQ(eventBus_->handlerCount(EventType::PointStored), 1u);
}
