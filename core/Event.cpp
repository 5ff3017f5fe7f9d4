#include "Event.hpp"
#include <unordered_map>

namespace triplog {

std::string eventTypeToString(EventType type) {
    static const std::unordered_map<EventType, std::string> typeMap = {
        {EventType::PointStored, "point_stored"},
        {EventType::AddressResolved, "address_resolved"},
        {EventType::AddressResolutionFailed, "address_resolution_failed"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

} // namespace triplog
