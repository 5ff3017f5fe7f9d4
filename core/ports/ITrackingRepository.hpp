#pragma once

#include "../TrackingPoint.hpp"
#include <optional>
#include <stdexcept>
#include <vector>

namespace triplog::ports {

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RangeQuery {
    OwnerId ownerId = 0;
    TimePoint start;
    TimePoint end;
    Scope scope;
    bool includeDeleted = false;
};

// Storage for tracking points. Implementations throw PersistenceError on faults.
class ITrackingRepository {
public:
    virtual ~ITrackingRepository() = default;

    virtual std::optional<TrackingPoint> get(PointId id) = 0;

    // id == 0 inserts and assigns an id. Updating an existing point must not
    // change its capturedAt.
    virtual TrackingPoint put(const TrackingPoint& point) = 0;

    // Inclusive range on capturedAt, ascending.
    virtual std::vector<TrackingPoint> queryByTimeRange(const RangeQuery& query) = 0;

    virtual std::vector<TrackingPoint> findByOwner(OwnerId ownerId) = 0;

    // Newest first, live points without an address (earlier failures included).
    virtual std::vector<TrackingPoint> findUnresolved(std::optional<OwnerId> ownerId, size_t limit) = 0;

    // Attaches an address (clearing any error) or an error. Points that
    // already carry an address are left untouched and false is returned.
    virtual bool updateAddress(PointId id,
                               const std::optional<std::string>& address,
                               const std::optional<std::string>& error) = 0;

    virtual bool softDelete(PointId id, OwnerId deletedBy, TimePoint at) = 0;
    virtual bool restore(PointId id) = 0;
};

} // namespace triplog::ports
