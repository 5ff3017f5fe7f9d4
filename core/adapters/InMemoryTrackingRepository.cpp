#include "InMemoryTrackingRepository.hpp"
#include <algorithm>

namespace triplog::adapters {

std::optional<TrackingPoint> InMemoryTrackingRepository::get(PointId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = points_.find(id);
    if (it == points_.end()) return std::nullopt;
    return it->second;
}

TrackingPoint InMemoryTrackingRepository::put(const TrackingPoint& point) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        throw ports::PersistenceError("tracking store rejected write");
    }

    TrackingPoint stored = point;
    if (stored.id == 0) {
        stored.id = nextId_++;
    } else {
        auto it = points_.find(stored.id);
        if (it != points_.end() && it->second.capturedAt != stored.capturedAt) {
            throw ports::PersistenceError("capturedAt is immutable for point " + std::to_string(stored.id));
        }
        nextId_ = std::max(nextId_, stored.id + 1);
    }

    points_[stored.id] = stored;
    return stored;
}

std::vector<TrackingPoint> InMemoryTrackingRepository::queryByTimeRange(const ports::RangeQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingPoint> result;
    for (const auto& [id, point] : points_) {
        if (point.ownerId != query.ownerId) continue;
        if (point.capturedAt < query.start || point.capturedAt > query.end) continue;
        if (!query.includeDeleted && point.isDeleted()) continue;
        if (!matchesScope(point, query.scope)) continue;
        result.push_back(point);
    }

    std::stable_sort(result.begin(), result.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
        return a.capturedAt < b.capturedAt;
    });
    return result;
}

std::vector<TrackingPoint> InMemoryTrackingRepository::findByOwner(OwnerId ownerId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingPoint> result;
    for (const auto& [id, point] : points_) {
        if (point.ownerId == ownerId && !point.isDeleted()) {
            result.push_back(point);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
        return a.capturedAt < b.capturedAt;
    });
    return result;
}

std::vector<TrackingPoint> InMemoryTrackingRepository::findUnresolved(std::optional<OwnerId> ownerId,
                                                                      size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingPoint> result;
    for (const auto& [id, point] : points_) {
        if (point.isDeleted() || point.hasAddress()) continue;
        if (ownerId && point.ownerId != *ownerId) continue;
        result.push_back(point);
    }

    std::stable_sort(result.begin(), result.end(), [](const TrackingPoint& a, const TrackingPoint& b) {
        return a.capturedAt > b.capturedAt;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

bool InMemoryTrackingRepository::updateAddress(PointId id,
                                               const std::optional<std::string>& address,
                                               const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        throw ports::PersistenceError("tracking store rejected address update");
    }

    auto it = points_.find(id);
    if (it == points_.end() || it->second.hasAddress()) return false;

    if (address && !address->empty()) {
        it->second.address = address;
        it->second.addressError.reset();
    } else {
        it->second.addressError = error;
    }
    ++addressWrites_;
    return true;
}

bool InMemoryTrackingRepository::softDelete(PointId id, OwnerId deletedBy, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = points_.find(id);
    if (it == points_.end() || it->second.isDeleted()) return false;

    it->second.deletedAt = at;
    it->second.deletedBy = deletedBy;
    return true;
}

bool InMemoryTrackingRepository::restore(PointId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = points_.find(id);
    if (it == points_.end() || !it->second.isDeleted()) return false;

    it->second.deletedAt.reset();
    it->second.deletedBy.reset();
    return true;
}

size_t InMemoryTrackingRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return points_.size();
}

size_t InMemoryTrackingRepository::addressWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return addressWrites_;
}

void InMemoryTrackingRepository::setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

bool InMemoryTrackingRepository::matchesScope(const TrackingPoint& point, const Scope& scope) {
    if (scope.organizationId && point.scope.organizationId != scope.organizationId) return false;
    if (scope.branchId && point.scope.branchId != scope.branchId) return false;
    return true;
}

} // namespace triplog::adapters
