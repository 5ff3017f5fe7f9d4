#pragma once

#include "IClock.hpp"
#include "TrackingPoint.hpp"
#include <optional>
#include <string>

namespace triplog {

enum class Timeframe {
    Today,
    Yesterday,
    ThisWeek,
    LastWeek,
    ThisMonth,
    LastMonth,
    Custom
};

std::string timeframeToString(Timeframe timeframe);
std::optional<Timeframe> stringToTimeframe(const std::string& str);

// Inclusive on both ends; end is the last millisecond of the final day.
struct Period {
    TimePoint start;
    TimePoint end;
};

struct TrackingQuery {
    Timeframe timeframe = Timeframe::Today;
    std::optional<TimePoint> startDate;
    std::optional<TimePoint> endDate;
    Scope scope;
};

// All calendar arithmetic is UTC and weeks start on Sunday.
// Throws std::invalid_argument for an incomplete or inverted custom range.
Period resolvePeriod(const TrackingQuery& query, TimePoint now);

Period dayPeriod(TimePoint day);
TimePoint startOfDay(TimePoint time);
TimePoint endOfDay(TimePoint time);

} // namespace triplog
