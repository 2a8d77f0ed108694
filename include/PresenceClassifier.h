#pragma once

#include "DetectionSettings.h"
#include "SlotVerdict.h"

namespace kitcheck {

// Stateless mapping from region signals to a verdict.
class PresenceClassifier {
public:
    explicit PresenceClassifier(const DetectionSettings &settings = DetectionSettings());

    [[nodiscard]] double confidence(const RegionSignals &metrics, const ResolvedThresholds &thresholds) const;
    [[nodiscard]] SlotStatus classify(double confidence) const;

    struct Result {
        SlotStatus status {SlotStatus::Uncertain};
        double confidence {0.0};
    };
    [[nodiscard]] Result evaluate(const RegionSignals &metrics, const ResolvedThresholds &thresholds) const;

    [[nodiscard]] const DetectionSettings &settings() const { return m_settings; }

private:
    DetectionSettings m_settings;
};

} // namespace kitcheck
