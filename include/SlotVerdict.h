#pragma once

#include <optional>
#include <string>

namespace kitcheck {

enum class SlotStatus {
    Present,
    Missing,
    Uncertain
};

struct RegionSignals {
    double brightnessRatio {0.0};
    double saturationRatio {0.0};
    double edgeDensity {0.0};
    double meanBrightness {0.0};
    double meanSaturation {0.0};
    int pixelCount {0};
};

struct SlotVerdict {
    std::string toolId;
    std::string name;
    int slotIndex {0};
    SlotStatus status {SlotStatus::Uncertain};
    double confidence {0.0};
    RegionSignals metrics;
    std::string note; // set when the verdict was forced, e.g. region outside the image
};

std::string toString(SlotStatus status);
// Accepts "present", "missing" and "uncertain"; anything else yields nullopt.
std::optional<SlotStatus> slotStatusFromString(const std::string &value);

} // namespace kitcheck
