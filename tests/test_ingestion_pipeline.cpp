#include <gtest/gtest.h>
#include "../core/domain/IngestionPipeline.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/adapters/InMemoryCacheStore.hpp"
#include "../core/adapters/InMemoryTrackingRepository.hpp"
#include "../core/adapters/InMemoryUserDirectory.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace triplog;
using namespace std::chrono_literals;

class IngestionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        cache_ = std::make_shared<adapters::InMemoryCacheStore>(clock_);
        repository_ = std::make_shared<adapters::InMemoryTrackingRepository>();
        directory_ = std::make_shared<adapters::InMemoryUserDirectory>();
        eventBus_ = std::make_shared<domain::EventBus>();

        ports::OwnerProfile owner;
        owner.id = 42;
        owner.name = "Thandi Mokoena";
        owner.scope.organizationId = 3;
        owner.scope.branchId = 7;
        directory_->addOwner(owner);

        pipeline_ = std::make_unique<domain::IngestionPipeline>(repository_, directory_, cache_, eventBus_, clock_);
    }

    LocationSample sample(double lat, double lon, std::optional<double> accuracy = 8.0) {
        LocationSample s;
        s.ownerId = 42;
        s.lat = lat;
        s.lon = lon;
        s.accuracy = accuracy;
        return s;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryCacheStore> cache_;
    std::shared_ptr<adapters::InMemoryTrackingRepository> repository_;
    std::shared_ptr<adapters::InMemoryUserDirectory> directory_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::unique_ptr<domain::IngestionPipeline> pipeline_;
};

TEST_F(IngestionPipelineTest, StoresValidSample) {
    auto result = pipeline_->ingest(sample(-26.2041, 28.0473));

    EXPECT_TRUE(result.stored);
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.message, "Location tracked successfully");
    ASSERT_TRUE(result.data.has_value());
    EXPECT_GT(result.data->id, 0);
    EXPECT_EQ(result.data->rawLocation, "-26.2041,28.0473");
    EXPECT_EQ(result.data->capturedAt, clock_->now());
    EXPECT_EQ(result.data->scope.organizationId, 3);
    EXPECT_FALSE(result.data->hasAddress());
    EXPECT_EQ(repository_->size(), 1u);
}

TEST_F(IngestionPipelineTest, PublishesPointStoredEvent) {
    std::vector<Event> seen;
    eventBus_->subscribe(EventType::PointStored, [&](const Event& e) { seen.push_back(e); });

    auto result = pipeline_->ingest(sample(-26.2041, 28.0473));
    EXPECT_TRUE(seen.empty());

    eventBus_->processEvents();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].ownerId, 42);
    EXPECT_EQ(seen[0].pointId, result.data->id);
}

TEST_F(IngestionPipelineTest, DeviceTimestampIsFloored) {
    auto s = sample(-26.2041, 28.0473);
    s.timestampMs = 1709539200123.9;

    auto result = pipeline_->ingest(s);

    ASSERT_TRUE(result.stored);
    EXPECT_EQ(result.data->deviceTimestampMs, 1709539200123);
    EXPECT_EQ(toEpochMillis(result.data->capturedAt), 1709539200123);
    EXPECT_EQ(result.data->receivedAt, clock_->now());
}

TEST_F(IngestionPipelineTest, VirtualLocationIsDiscardedWithoutConsumingRateLimit) {
    auto virtualResult = pipeline_->ingest(sample(-26.1220000, 28.0473));

    EXPECT_FALSE(virtualResult.stored);
    EXPECT_FALSE(virtualResult.isError());
    EXPECT_EQ(virtualResult.message, "Virtual location detected and ignored");
    ASSERT_EQ(virtualResult.warnings.size(), 1u);
    EXPECT_EQ(virtualResult.warnings[0].type, WarningType::VirtualLocation);
    EXPECT_EQ(repository_->size(), 0u);

    // Both real points still fit in the window.
    EXPECT_TRUE(pipeline_->ingest(sample(-26.2041, 28.0473)).stored);
    EXPECT_TRUE(pipeline_->ingest(sample(-26.2045, 28.0473)).stored);
}

TEST_F(IngestionPipelineTest, LowAccuracyIsDiscarded) {
    auto result = pipeline_->ingest(sample(-26.2041, 28.0473, 35.0));

    EXPECT_FALSE(result.stored);
    EXPECT_FALSE(result.isError());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].type, WarningType::LowAccuracyGps);
    EXPECT_EQ(repository_->size(), 0u);
}

TEST_F(IngestionPipelineTest, ThirdPointInWindowIsRateLimited) {
    EXPECT_TRUE(pipeline_->ingest(sample(-26.2041, 28.0473)).stored);
    EXPECT_TRUE(pipeline_->ingest(sample(-26.2043, 28.0473)).stored);

    auto limited = pipeline_->ingest(sample(-26.2045, 28.0473));
    EXPECT_FALSE(limited.stored);
    EXPECT_FALSE(limited.isError());
    ASSERT_EQ(limited.warnings.size(), 1u);
    EXPECT_EQ(limited.warnings[0].type, WarningType::RateLimitExceeded);
    EXPECT_EQ(repository_->size(), 2u);

    clock_->advance(61s);
    EXPECT_TRUE(pipeline_->ingest(sample(-26.2045, 28.0473)).stored);
}

TEST_F(IngestionPipelineTest, MissingFieldsAreInvalidInput) {
    LocationSample noOwner = sample(-26.2041, 28.0473);
    noOwner.ownerId.reset();
    auto result = pipeline_->ingest(noOwner);
    EXPECT_EQ(result.errorKind, IngestErrorKind::InvalidInput);

    LocationSample noLat = sample(-26.2041, 28.0473);
    noLat.lat.reset();
    result = pipeline_->ingest(noLat);
    EXPECT_EQ(result.errorKind, IngestErrorKind::InvalidInput);
    EXPECT_EQ(result.errorMessage, "Latitude and longitude are required");
}

TEST_F(IngestionPipelineTest, OutOfRangeIsInvalidInput) {
    auto result = pipeline_->ingest(sample(95.0, 28.0473));
    EXPECT_EQ(result.errorKind, IngestErrorKind::InvalidInput);
    EXPECT_FALSE(result.stored);
}

TEST_F(IngestionPipelineTest, UnknownOwnerIsRejected) {
    auto s = sample(-26.2041, 28.0473);
    s.ownerId = 999;

    auto result = pipeline_->ingest(s);

    EXPECT_EQ(result.errorKind, IngestErrorKind::UnknownOwner);
    EXPECT_EQ(result.message, "User with ID 999 not found");
    EXPECT_EQ(repository_->size(), 0u);
}

TEST_F(IngestionPipelineTest, StoreFailureIsPersistenceError) {
    repository_->setFailWrites(true);

    auto result = pipeline_->ingest(sample(-26.2041, 28.0473));

    EXPECT_EQ(result.errorKind, IngestErrorKind::Persistence);
    EXPECT_FALSE(result.stored);
    EXPECT_EQ(eventBus_->pendingCount(), 0u);
}

TEST_F(IngestionPipelineTest, CallerScopeOverridesDirectory) {
    Scope scope;
    scope.organizationId = 11;

    auto result = pipeline_->ingest(sample(-26.2041, 28.0473), scope);

    ASSERT_TRUE(result.stored);
    EXPECT_EQ(result.data->scope.organizationId, 11);
    EXPECT_FALSE(result.data->scope.branchId.has_value());
}

TEST_F(IngestionPipelineTest, StoringInvalidatesCachedAnalytics) {
    const auto dayKey = domain::IngestionPipeline::analyticsKey(42, clock_->now());
    cache_->set(dayKey, "{}", std::chrono::hours(1));
    cache_->set("timeframe:42:today", "{}", std::chrono::hours(1));
    cache_->set("timeframe:43:today", "{}", std::chrono::hours(1));

    ASSERT_TRUE(pipeline_->ingest(sample(-26.2041, 28.0473)).stored);

    EXPECT_FALSE(cache_->get(dayKey).has_value());
    EXPECT_FALSE(cache_->get("timeframe:42:today").has_value());
    EXPECT_TRUE(cache_->get("timeframe:43:today").has_value());
}

TEST_F(IngestionPipelineTest, CacheKeyFormats) {
    EXPECT_EQ(domain::IngestionPipeline::analyticsKey(42, *parseIso8601("2024-03-04T10:00:00Z")),
              "analytics:42:2024-03-04");
    EXPECT_EQ(domain::IngestionPipeline::timeframePrefix(42), "timeframe:42:");
}

TEST_F(IngestionPipelineTest, IngestJsonAcceptsNestedCoords) {
    auto result = pipeline_->ingestJson(
        R"({"userId": 42, "coords": {"latitude": -26.2041, "longitude": 28.0473, "accuracy": 6}})");
    EXPECT_TRUE(result.stored);
}

TEST_F(IngestionPipelineTest, IngestJsonRejectsGarbage) {
    auto result = pipeline_->ingestJson("not json");
    EXPECT_EQ(result.errorKind, IngestErrorKind::InvalidInput);
}
