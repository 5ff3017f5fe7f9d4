#include "AddressResolutionStage.hpp"
#include "IngestionPipeline.hpp"
#include "../Log.hpp"
#include <algorithm>
#include <map>

namespace triplog::domain {

AddressResolutionStage::AddressResolutionStage(std::shared_ptr<ports::ITrackingRepository> repository,
                                               std::shared_ptr<GeocodeResolver> resolver,
                                               std::shared_ptr<ports::IEventBus> eventBus,
                                               std::shared_ptr<ports::ICacheStore> cache)
    : repository_(std::move(repository)),
      resolver_(std::move(resolver)),
      eventBus_(std::move(eventBus)),
      cache_(std::move(cache)) {
}

AddressResolutionStage::~AddressResolutionStage() {
    stop();
}

void AddressResolutionStage::start() {
    if (running_) return;
    running_ = true;
    subscription_ = eventBus_->subscribe(EventType::PointStored, [this](const Event& event) {
        enqueue(event.pointId);
    });
}

void AddressResolutionStage::stop() {
    if (!running_) return;
    running_ = false;
    if (subscription_) {
        eventBus_->unsubscribe(*subscription_);
        subscription_.reset();
    }
}

void AddressResolutionStage::enqueue(PointId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(id);
}

size_t AddressResolutionStage::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<PointId> AddressResolutionStage::failedPoints() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PointId>(failed_.begin(), failed_.end());
}

BackfillSummary AddressResolutionStage::processPending() {
    std::vector<PointId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.swap(pending_);
    }
    return resolve(ids);
}

BackfillSummary AddressResolutionStage::retryFailed() {
    std::vector<PointId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.assign(failed_.begin(), failed_.end());
        failed_.clear();
    }
    if (!ids.empty()) {
        Log::info("AddressStage", "Retrying " + std::to_string(ids.size()) + " unresolved points");
    }
    return resolve(ids);
}

BackfillSummary AddressResolutionStage::resolve(const std::vector<PointId>& ids) {
    BackfillSummary total;
    if (ids.empty()) return total;

    std::map<OwnerId, std::vector<TrackingPoint>> byOwner;
    for (PointId id : ids) {
        std::optional<TrackingPoint> point;
        try {
            point = repository_->get(id);
        } catch (const std::exception& e) {
            Log::error("AddressStage", "Could not load point " + std::to_string(id) + ": " + e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            failed_.insert(id);
            continue;
        }
        if (!point || point->isDeleted() || point->hasAddress()) continue;
        byOwner[point->ownerId].push_back(*point);
    }

    for (auto& [ownerId, points] : byOwner) {
        std::stable_sort(points.begin(), points.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
            return a.capturedAt < b.capturedAt;
        });

        auto result = resolver_->backfill(points, repository_.get());
        const auto& summary = result.summary;

        total.candidates += summary.candidates;
        total.alreadyResolved += summary.alreadyResolved;
        total.groups += summary.groups;
        total.groupsResolved += summary.groupsResolved;
        total.groupsFailed += summary.groupsFailed;
        total.groupsSkipped += summary.groupsSkipped;
        total.resolvedPoints += summary.resolvedPoints;
        total.failedPoints += summary.failedPoints;
        total.skippedPoints += summary.skippedPoints;
        total.deferredPoints += summary.deferredPoints;
        total.externalCalls += summary.externalCalls;
        total.circuitOpen = total.circuitOpen || summary.circuitOpen;
        total.resolvedPointIds.insert(total.resolvedPointIds.end(),
                                      summary.resolvedPointIds.begin(), summary.resolvedPointIds.end());
        total.failedPointIds.insert(total.failedPointIds.end(),
                                    summary.failedPointIds.begin(), summary.failedPointIds.end());
        total.skippedPointIds.insert(total.skippedPointIds.end(),
                                     summary.skippedPointIds.begin(), summary.skippedPointIds.end());

        bool anyResolved = false;
        for (const auto& point : result.points) {
            // Failed, skipped and deferred points all wait for retryFailed().
            if (point.hasAddress()) {
                anyResolved = true;
                publishOutcome(point, true);
            } else {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    failed_.insert(point.id);
                }
                publishOutcome(point, false);
            }
        }

        if (anyResolved) {
            try {
                cache_->removeByPrefix("analytics:" + std::to_string(ownerId) + ":");
                cache_->removeByPrefix(IngestionPipeline::timeframePrefix(ownerId));
            } catch (const std::exception& e) {
                Log::warn("AddressStage", "Could not invalidate analytics cache: " + std::string(e.what()));
            }
        }
    }

    return total;
}

void AddressResolutionStage::publishOutcome(const TrackingPoint& point, bool resolved) {
    Event event;
    event.eventType = resolved ? EventType::AddressResolved : EventType::AddressResolutionFailed;
    event.ownerId = point.ownerId;
    event.pointId = point.id;
    event.timestamp = point.receivedAt;
    if (resolved) {
        event.extras["address"] = *point.address;
    } else {
        event.extras["error"] = point.addressError.value_or("Skipped by circuit breaker");
    }
    eventBus_->publish(event);
}

} // namespace triplog::domain
