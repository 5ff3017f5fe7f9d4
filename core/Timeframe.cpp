#include "Timeframe.hpp"
#include <ctime>
#include <stdexcept>
#include <unordered_map>

namespace triplog {

namespace {

constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

int64_t dayIndex(TimePoint time) {
    int64_t ms = toEpochMillis(time);
    int64_t q = ms / kMillisPerDay;
    if (ms % kMillisPerDay != 0 && ms < 0) --q;
    return q;
}

TimePoint fromDayIndex(int64_t day) {
    return fromEpochMillis(day * kMillisPerDay);
}

// 0 = Sunday; 1970-01-01 was a Thursday.
int weekday(int64_t day) {
    int w = static_cast<int>((day + 4) % 7);
    return w < 0 ? w + 7 : w;
}

TimePoint startOfMonth(TimePoint time, int monthOffset) {
    std::time_t seconds = static_cast<std::time_t>(dayIndex(time) * 86400);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::tm first{};
    first.tm_year = tm.tm_year;
    first.tm_mon = tm.tm_mon + monthOffset;
    first.tm_mday = 1;
#ifdef _WIN32
    std::time_t result = _mkgmtime(&first);
#else
    std::time_t result = timegm(&first);
#endif
    return fromEpochMillis(static_cast<int64_t>(result) * 1000);
}

} // namespace

std::string timeframeToString(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::Today: return "today";
        case Timeframe::Yesterday: return "yesterday";
        case Timeframe::ThisWeek: return "this_week";
        case Timeframe::LastWeek: return "last_week";
        case Timeframe::ThisMonth: return "this_month";
        case Timeframe::LastMonth: return "last_month";
        case Timeframe::Custom: return "custom";
    }
    return "today";
}

std::optional<Timeframe> stringToTimeframe(const std::string& str) {
    static const std::unordered_map<std::string, Timeframe> stringMap = {
        {"today", Timeframe::Today},
        {"yesterday", Timeframe::Yesterday},
        {"this_week", Timeframe::ThisWeek},
        {"last_week", Timeframe::LastWeek},
        {"this_month", Timeframe::ThisMonth},
        {"last_month", Timeframe::LastMonth},
        {"custom", Timeframe::Custom}
    };

    auto it = stringMap.find(str);
    if (it == stringMap.end()) return std::nullopt;
    return it->second;
}

TimePoint startOfDay(TimePoint time) {
    return fromDayIndex(dayIndex(time));
}

TimePoint endOfDay(TimePoint time) {
    return fromDayIndex(dayIndex(time) + 1) - std::chrono::milliseconds(1);
}

Period dayPeriod(TimePoint day) {
    return Period{startOfDay(day), endOfDay(day)};
}

Period resolvePeriod(const TrackingQuery& query, TimePoint now) {
    int64_t today = dayIndex(now);
    const auto oneMs = std::chrono::milliseconds(1);

    switch (query.timeframe) {
        case Timeframe::Today:
            return dayPeriod(now);

        case Timeframe::Yesterday:
            return dayPeriod(fromDayIndex(today - 1));

        case Timeframe::ThisWeek: {
            int64_t weekStart = today - weekday(today);
            return Period{fromDayIndex(weekStart), fromDayIndex(weekStart + 7) - oneMs};
        }

        case Timeframe::LastWeek: {
            int64_t weekStart = today - weekday(today) - 7;
            return Period{fromDayIndex(weekStart), fromDayIndex(weekStart + 7) - oneMs};
        }

        case Timeframe::ThisMonth:
            return Period{startOfMonth(now, 0), startOfMonth(now, 1) - oneMs};

        case Timeframe::LastMonth:
            return Period{startOfMonth(now, -1), startOfMonth(now, 0) - oneMs};

        case Timeframe::Custom: {
            if (!query.startDate || !query.endDate) {
                throw std::invalid_argument("Start date and end date are required for custom timeframe");
            }
            if (*query.startDate > *query.endDate) {
                throw std::invalid_argument("Start date must be before end date");
            }
            return Period{startOfDay(*query.startDate), endOfDay(*query.endDate)};
        }
    }
    return dayPeriod(now);
}

} // namespace triplog
