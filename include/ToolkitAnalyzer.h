#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "DetectionSettings.h"
#include "MarkerLocator.h"
#include "PresenceClassifier.h"
#include "RegionSignalExtractor.h"
#include "RegistrationEngine.h"
#include "ToolkitState.h"
#include "ToolkitTemplate.h"
#include "VisualizationRenderer.h"

namespace kitcheck {

struct AnalysisResult {
    std::vector<SlotVerdict> verdicts; // template tool order
    ToolkitStatus overallStatus {ToolkitStatus::Incomplete};
    CheckInSummary summary;
    cv::Mat annotatedImage;
    RegistrationInfo registration;
    std::vector<Region> regions; // per verdict, in working image coordinates
    std::vector<Marker> markers; // as detected in the capture
};

// Runs the full pipeline on one captured image: markers, registration, per-slot signals, verdicts and
// the annotated rendering. Synchronous and free of shared state.
class ToolkitAnalyzer {
public:
    explicit ToolkitAnalyzer(const DetectionSettings &detection = DetectionSettings(),
                             const MarkerSettings &markers = MarkerSettings(),
                             const AnnotationOptions &annotation = AnnotationOptions());

    // Throws ConfigurationError for an unusable template or a toolkit of another template, and
    // DecodeError for an empty capture. Both are raised before any image work.
    [[nodiscard]] AnalysisResult analyze(const ToolkitTemplate &toolkitTemplate,
                                         const Toolkit &toolkit,
                                         const cv::Mat &captured) const;

    [[nodiscard]] std::vector<Marker> detectMarkers(const cv::Mat &image) const;

    [[nodiscard]] const DetectionSettings &detectionSettings() const { return m_detection; }

private:
    DetectionSettings m_detection;
    MarkerLocator m_locator;
    RegistrationEngine m_registration;
    RegionSignalExtractor m_extractor;
    PresenceClassifier m_classifier;
    VisualizationRenderer m_renderer;
};

} // namespace kitcheck
