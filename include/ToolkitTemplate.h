#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "DetectionSettings.h"
#include "Marker.h"
#include "Region.h"

namespace kitcheck {

enum class FoamColor {
    DarkGrey,
    Black,
    Yellow,
    Red,
    Blue
};

struct ToolDefinition {
    std::string toolId;
    std::string name;
    std::string description;
    int slotIndex {0}; // 1-based
    std::optional<Region> region;
};

struct ToolkitTemplate {
    std::string templateId;
    std::string name;
    std::string description;
    FoamColor foamColor {FoamColor::DarkGrey};
    std::vector<ToolDefinition> tools;
    ThresholdOverrides thresholds;

    // Reference frame the regions are drawn in. Empty when the template was authored without one.
    cv::Size referenceSize {0, 0};
    std::string referenceImagePath;
    std::vector<Marker> referenceMarkers;

    [[nodiscard]] bool hasReferenceFrame() const { return referenceSize.width > 0 && referenceSize.height > 0; }

    // Throws ConfigurationError when a tool lacks a usable region.
    void validateForAnalysis() const;
};

std::string toString(FoamColor color);
FoamColor foamColorFromString(const std::string &value, FoamColor fallback = FoamColor::DarkGrey);

} // namespace kitcheck
