#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace triplog {

using TimePoint = std::chrono::system_clock::time_point;

class IClock {
public:
    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public IClock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }

    void sleepFor(std::chrono::milliseconds duration) override;
};

int64_t toEpochMillis(TimePoint time);
TimePoint fromEpochMillis(int64_t millis);

// 2025-03-14T09:26:53.589Z
std::string formatIso8601(TimePoint time);
// 2025-03-14, UTC calendar day
std::string formatDate(TimePoint time);

// Accepts "YYYY-MM-DD" and "YYYY-MM-DDTHH:MM:SS[.mmm][Z]", always UTC.
std::optional<TimePoint> parseIso8601(const std::string& text);

} // namespace triplog
