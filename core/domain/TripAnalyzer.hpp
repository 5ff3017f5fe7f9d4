#pragma once

#include "LocationValidator.hpp"
#include "../Analytics.hpp"
#include "../EngineConfig.hpp"
#include <vector>

namespace triplog::domain {

class TripAnalyzer {
public:
    TripAnalyzer(TripConfig config = {}, ValidationConfig validation = {});

    // Points are expected in capture order; fewer than two usable points
    // yield a zeroed summary.
    TripSummary analyze(const std::vector<TrackingPoint>& points) const;

    static std::string addressLabel(const TrackingPoint& point);

private:
    TripConfig config_;
    LocationValidator validator_;
};

} // namespace triplog::domain
