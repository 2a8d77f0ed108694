#include "PresenceClassifier.h"

#include <algorithm>

namespace kitcheck {

namespace {

double normalized(double ratio, double saturationPoint)
{
    if (saturationPoint <= 0.0) {
        return ratio > 0.0 ? 1.0 : 0.0;
    }
    return std::min(ratio / saturationPoint, 1.0);
}

} // namespace

PresenceClassifier::PresenceClassifier(const DetectionSettings &settings)
    : m_settings(settings)
{
}

double PresenceClassifier::confidence(const RegionSignals &metrics, const ResolvedThresholds &thresholds) const
{
    double brightness = metrics.brightnessRatio;
    double saturation = metrics.saturationRatio;
    double edges = metrics.edgeDensity;
    if (m_settings.normalizeSignals) {
        brightness = normalized(brightness, thresholds.occupiedRatio);
        saturation = normalized(saturation, thresholds.colorRatio);
        edges = normalized(edges, thresholds.edgeDensity);
    }

    const SignalWeights &w = m_settings.weights;
    const double score = w.brightness * brightness + w.saturation * saturation + w.edges * edges;
    return std::clamp(score, 0.0, 1.0);
}

SlotStatus PresenceClassifier::classify(double value) const
{
    if (value >= m_settings.presentCutoff) {
        return SlotStatus::Present;
    }
    if (value <= m_settings.missingCutoff) {
        return SlotStatus::Missing;
    }
    return SlotStatus::Uncertain;
}

PresenceClassifier::Result PresenceClassifier::evaluate(const RegionSignals &metrics,
                                                        const ResolvedThresholds &thresholds) const
{
    Result result;
    result.confidence = confidence(metrics, thresholds);
    result.status = classify(result.confidence);
    return result;
}

} // namespace kitcheck
