#pragma once

#include "IClock.hpp"
#include "TrackingPoint.hpp"
#include <string>
#include <unordered_map>

namespace triplog {

enum class EventType {
    PointStored,
    AddressResolved,
    AddressResolutionFailed
};

struct Event {
    EventType eventType = EventType::PointStored;
    OwnerId ownerId = 0;
    PointId pointId = 0;
    TimePoint timestamp;

    std::unordered_map<std::string, std::string> extras;
};

std::string eventTypeToString(EventType type);

} // namespace triplog
