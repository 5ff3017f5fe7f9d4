#pragma once

#include "../EngineConfig.hpp"
#include "../TrackingPoint.hpp"
#include <optional>
#include <vector>

namespace triplog::domain {

enum class Verdict {
    Accept,
    RejectVirtual,
    RejectInaccurate,
    RejectOutOfRange
};

std::string verdictToString(Verdict verdict);

struct ValidationOutcome {
    Verdict verdict = Verdict::Accept;
    std::string message;
    std::optional<Warning> warning;   // set for the virtual and accuracy rejections

    bool accepted() const { return verdict == Verdict::Accept; }
};

struct AccuracyFilterResult {
    std::vector<TrackingPoint> points;
    size_t withAccuracy = 0;
    size_t withoutAccuracy = 0;
    size_t aboveThreshold = 0;
};

class LocationValidator {
public:
    explicit LocationValidator(ValidationConfig config = {});

    // Range first, then the virtual marker, then the accuracy gate.
    ValidationOutcome validate(double lat, double lon, std::optional<double> accuracy) const;

    bool isVirtual(double lat, double lon) const;
    bool hasAcceptableAccuracy(std::optional<double> accuracy) const;

    AccuracyFilterResult filterByAccuracy(const std::vector<TrackingPoint>& points) const;

    // Absolute value in shortest decimal form without the decimal point,
    // e.g. -26.122 -> "26122".
    static std::string digitsOf(double value);

    const ValidationConfig& config() const { return config_; }

private:
    ValidationConfig config_;
};

} // namespace triplog::domain
