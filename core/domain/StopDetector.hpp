#pragma once

#include "LocationValidator.hpp"
#include "../Analytics.hpp"
#include "../EngineConfig.hpp"
#include <vector>

namespace triplog::domain {

// Single forward pass: a point within the radius of the running centre joins
// the current cluster, anything else closes it. Clusters shorter than the
// minimum dwell are dropped.
class StopDetector {
public:
    StopDetector(StopConfig config = {}, ValidationConfig validation = {});

    StopDetectionResult detectStops(const std::vector<TrackingPoint>& points) const;

    static std::string productivityLabel(double durationMinutes);

private:
    struct Cluster {
        double lat = 0.0;
        double lon = 0.0;
        size_t count = 0;
        TimePoint start;
        TimePoint end;
        std::optional<std::string> address;
    };

    void close(const Cluster& cluster, std::vector<Stop>& stops) const;

    StopConfig config_;
    LocationValidator validator_;
};

} // namespace triplog::domain
