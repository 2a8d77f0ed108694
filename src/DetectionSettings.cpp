#include "DetectionSettings.h"

#include "ToolkitTemplate.h"

namespace kitcheck {

double resolveThreshold(const ToolkitTemplate &toolkitTemplate,
                        ThresholdKey key,
                        const DetectionSettings &defaults)
{
    const ThresholdOverrides &o = toolkitTemplate.thresholds;
    switch (key) {
    case ThresholdKey::Brightness:
        return o.brightness.value_or(defaults.brightnessThreshold);
    case ThresholdKey::Saturation:
        return o.saturation.value_or(defaults.saturationThreshold);
    case ThresholdKey::EdgeDensity:
        return o.edgeDensity.value_or(defaults.edgeDensityThreshold);
    case ThresholdKey::OccupiedRatio:
        return o.occupiedRatio.value_or(defaults.occupiedRatioThreshold);
    case ThresholdKey::ColorRatio:
        return o.colorRatio.value_or(defaults.colorRatioThreshold);
    }
    return 0.0;
}

ResolvedThresholds resolveThresholds(const ToolkitTemplate &toolkitTemplate, const DetectionSettings &defaults)
{
    ResolvedThresholds resolved;
    resolved.brightness = resolveThreshold(toolkitTemplate, ThresholdKey::Brightness, defaults);
    resolved.saturation = resolveThreshold(toolkitTemplate, ThresholdKey::Saturation, defaults);
    resolved.edgeDensity = resolveThreshold(toolkitTemplate, ThresholdKey::EdgeDensity, defaults);
    resolved.occupiedRatio = resolveThreshold(toolkitTemplate, ThresholdKey::OccupiedRatio, defaults);
    resolved.colorRatio = resolveThreshold(toolkitTemplate, ThresholdKey::ColorRatio, defaults);
    return resolved;
}

const char *thresholdKeyName(ThresholdKey key)
{
    switch (key) {
    case ThresholdKey::Brightness:
        return "brightness_threshold";
    case ThresholdKey::Saturation:
        return "saturation_threshold";
    case ThresholdKey::EdgeDensity:
        return "edge_density_threshold";
    case ThresholdKey::OccupiedRatio:
        return "occupied_ratio_threshold";
    case ThresholdKey::ColorRatio:
        return "color_ratio_threshold";
    }
    return "unknown";
}

} // namespace kitcheck
