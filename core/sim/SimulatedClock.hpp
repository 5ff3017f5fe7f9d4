#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <vector>

namespace triplog::sim {

// Manual time source. sleepFor() advances the clock instead of blocking and
// records the requested pause.
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(TimePoint startTime = fromEpochMillis(1700000000000));
    ~SimulatedClock() override = default;

    // IClock interface
    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(TimePoint time);

    std::vector<std::chrono::milliseconds> sleeps() const;
    std::chrono::milliseconds totalSlept() const;
    void clearSleeps();

private:
    TimePoint simulatedTime_;
    std::vector<std::chrono::milliseconds> sleeps_;
    mutable std::mutex mutex_;
};

} // namespace triplog::sim
