#include "SimulatedClock.hpp"

namespace triplog::sim {

SimulatedClock::SimulatedClock(TimePoint startTime)
    : simulatedTime_(startTime) {
}

TimePoint SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

void SimulatedClock::sleepFor(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeps_.push_back(duration);
    simulatedTime_ += duration;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setCurrentTime(TimePoint time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
}

std::vector<std::chrono::milliseconds> SimulatedClock::sleeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleeps_;
}

std::chrono::milliseconds SimulatedClock::totalSlept() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::chrono::milliseconds total{0};
    for (auto s : sleeps_) total += s;
    return total;
}

void SimulatedClock::clearSleeps() {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeps_.clear();
}

} // namespace triplog::sim
