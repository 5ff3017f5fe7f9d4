#pragma once

#include "GeocodeResolver.hpp"
#include "../ports/ICacheStore.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/ITrackingRepository.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace triplog::domain {

// Deferred second stage of ingestion. Collects PointStored events, resolves
// the addresses in batches and keeps the ids that could not be resolved as
// its error channel until retryFailed() is called.
class AddressResolutionStage {
public:
    AddressResolutionStage(std::shared_ptr<ports::ITrackingRepository> repository,
                           std::shared_ptr<GeocodeResolver> resolver,
                           std::shared_ptr<ports::IEventBus> eventBus,
                           std::shared_ptr<ports::ICacheStore> cache);
    ~AddressResolutionStage();

    AddressResolutionStage(const AddressResolutionStage&) = delete;
    AddressResolutionStage& operator=(const AddressResolutionStage&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    void enqueue(PointId id);
    BackfillSummary processPending();
    BackfillSummary retryFailed();

    size_t pendingCount() const;
    std::vector<PointId> failedPoints() const;

private:
    BackfillSummary resolve(const std::vector<PointId>& ids);
    void publishOutcome(const TrackingPoint& point, bool resolved);

    std::shared_ptr<ports::ITrackingRepository> repository_;
    std::shared_ptr<GeocodeResolver> resolver_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<ports::ICacheStore> cache_;

    std::vector<PointId> pending_;
    std::set<PointId> failed_;
    mutable std::mutex mutex_;
    bool running_ = false;
    std::optional<ports::IEventBus::SubscriptionId> subscription_;
};

} // namespace triplog::domain
