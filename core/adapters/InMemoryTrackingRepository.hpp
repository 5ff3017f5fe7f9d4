#pragma once

#include "../ports/ITrackingRepository.hpp"
#include <map>
#include <mutex>

namespace triplog::adapters {

class InMemoryTrackingRepository : public ports::ITrackingRepository {
public:
    InMemoryTrackingRepository() = default;
    ~InMemoryTrackingRepository() override = default;

    std::optional<TrackingPoint> get(PointId id) override;
    TrackingPoint put(const TrackingPoint& point) override;
    std::vector<TrackingPoint> queryByTimeRange(const ports::RangeQuery& query) override;
    std::vector<TrackingPoint> findByOwner(OwnerId ownerId) override;
    std::vector<TrackingPoint> findUnresolved(std::optional<OwnerId> ownerId, size_t limit) override;
    bool updateAddress(PointId id,
                       const std::optional<std::string>& address,
                       const std::optional<std::string>& error) override;
    bool softDelete(PointId id, OwnerId deletedBy, TimePoint at) override;
    bool restore(PointId id) override;

    size_t size() const;
    size_t addressWrites() const;

    // Makes writes throw PersistenceError.
    void setFailWrites(bool fail);

private:
    static bool matchesScope(const TrackingPoint& point, const Scope& scope);

    std::map<PointId, TrackingPoint> points_;
    PointId nextId_ = 1;
    size_t addressWrites_ = 0;
    bool failWrites_ = false;
    mutable std::mutex mutex_;
};

} // namespace triplog::adapters
