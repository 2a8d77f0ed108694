#pragma once

#include <optional>

namespace kitcheck {

struct ToolkitTemplate;

enum class ThresholdKey {
    Brightness,
    Saturation,
    EdgeDensity,
    OccupiedRatio,
    ColorRatio
};

// Per-template overrides; unset members fall back to the global defaults.
struct ThresholdOverrides {
    std::optional<double> brightness;
    std::optional<double> saturation;
    std::optional<double> edgeDensity;
    std::optional<double> occupiedRatio;
    std::optional<double> colorRatio;

    [[nodiscard]] bool empty() const
    {
        return !brightness && !saturation && !edgeDensity && !occupiedRatio && !colorRatio;
    }
};

struct SignalWeights {
    double brightness {0.5};
    double saturation {0.3};
    double edges {0.2};
};

// Application-wide detection defaults. Weights and cutoffs are never overridden per template.
struct DetectionSettings {
    double brightnessThreshold {60.0};     // gray level, 0-255
    double saturationThreshold {40.0};     // HSV saturation, 0-255
    double edgeDensityThreshold {0.05};    // edge pixel ratio treated as fully textured
    double occupiedRatioThreshold {0.25};  // bright pixel ratio treated as fully occupied
    double colorRatioThreshold {0.15};     // saturated pixel ratio treated as fully colored
    double cannyLow {50.0};
    double cannyHigh {150.0};
    SignalWeights weights;
    double presentCutoff {0.7};
    double missingCutoff {0.3};
    bool normalizeSignals {false};
};

// Thresholds for a single extraction, resolved once from template and defaults.
struct ResolvedThresholds {
    double brightness {60.0};
    double saturation {40.0};
    double edgeDensity {0.05};
    double occupiedRatio {0.25};
    double colorRatio {0.15};
};

[[nodiscard]] double resolveThreshold(const ToolkitTemplate &toolkitTemplate,
                                      ThresholdKey key,
                                      const DetectionSettings &defaults);

[[nodiscard]] ResolvedThresholds resolveThresholds(const ToolkitTemplate &toolkitTemplate,
                                                   const DetectionSettings &defaults);

const char *thresholdKeyName(ThresholdKey key);

} // namespace kitcheck
