#include "IClock.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace triplog {

namespace {

bool toUtc(std::time_t t, std::tm& out) {
#ifdef _WIN32
    return gmtime_s(&out, &t) == 0;
#else
    return gmtime_r(&t, &out) != nullptr;
#endif
}

std::time_t fromUtc(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

int64_t toEpochMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

std::string formatIso8601(TimePoint time) {
    int64_t millis = toEpochMillis(time);
    std::time_t seconds = static_cast<std::time_t>(floorDiv(millis, 1000));
    int64_t ms = millis - static_cast<int64_t>(seconds) * 1000;

    std::stringstream ss;
    std::tm tm_buf{};
    if (toUtc(seconds, tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::string formatDate(TimePoint time) {
    std::time_t seconds = static_cast<std::time_t>(floorDiv(toEpochMillis(time), 1000));
    std::tm tm_buf{};
    if (!toUtc(seconds, tm_buf)) {
        return "";
    }
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d");
    return ss.str();
}

std::optional<TimePoint> parseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        return std::nullopt;
    }

    int millis = 0;
    std::string rest = text.substr(static_cast<size_t>(consumed));
    if (!rest.empty()) {
        if (rest[0] != 'T' && rest[0] != ' ') return std::nullopt;
        int timeConsumed = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &timeConsumed) != 3) {
            return std::nullopt;
        }
        std::string tail = rest.substr(1 + static_cast<size_t>(timeConsumed));
        if (!tail.empty() && tail[0] == '.') {
            size_t pos = 1;
            int digits = 0;
            while (pos < tail.size() && std::isdigit(static_cast<unsigned char>(tail[pos]))) {
                if (digits < 3) millis = millis * 10 + (tail[pos] - '0');
                ++digits;
                ++pos;
            }
            for (; digits < 3; ++digits) millis *= 10;
            tail = tail.substr(pos);
        }
        if (!tail.empty() && tail != "Z") return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t seconds = fromUtc(tm);
    return fromEpochMillis(static_cast<int64_t>(seconds) * 1000 + millis);
}

} // namespace triplog
