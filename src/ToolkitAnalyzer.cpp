#include "ToolkitAnalyzer.h"

#include <QString>

#include "Errors.h"
#include "Logger.h"
#include "StatusTransitionEngine.h"

namespace kitcheck {

namespace {

// Marker outlines follow the image into the reference frame when it was warped.
std::vector<Marker> markersInWorkingFrame(const RegistrationResult &registration)
{
    if (!registration.registered) {
        return registration.capturedMarkers;
    }
    std::vector<Marker> mapped;
    for (const Marker &marker : registration.capturedMarkers) {
        const std::vector<cv::Point2f> corners(marker.corners.begin(), marker.corners.end());
        const std::vector<cv::Point2f> warped = RegistrationEngine::mapToReference(registration.homography, corners);
        if (warped.size() != 4) {
            continue;
        }
        mapped.push_back(Marker::fromCorners(marker.id, {warped[0], warped[1], warped[2], warped[3]}));
    }
    return mapped;
}

} // namespace

ToolkitAnalyzer::ToolkitAnalyzer(const DetectionSettings &detection,
                                 const MarkerSettings &markers,
                                 const AnnotationOptions &annotation)
    : m_detection(detection)
    , m_locator(markers)
    , m_extractor(detection.cannyLow, detection.cannyHigh)
    , m_classifier(detection)
    , m_renderer(annotation)
{
}

std::vector<Marker> ToolkitAnalyzer::detectMarkers(const cv::Mat &image) const
{
    return m_locator.detect(image);
}

AnalysisResult ToolkitAnalyzer::analyze(const ToolkitTemplate &toolkitTemplate,
                                        const Toolkit &toolkit,
                                        const cv::Mat &captured) const
{
    if (!toolkit.templateId.empty() && toolkit.templateId != toolkitTemplate.templateId) {
        throw ConfigurationError("Toolkit '" + toolkit.toolkitId + "' uses template '" + toolkit.templateId +
                                 "', not '" + toolkitTemplate.templateId + "'");
    }
    toolkitTemplate.validateForAnalysis();
    if (captured.empty()) {
        throw DecodeError("Captured image is empty");
    }

    AnalysisResult result;
    result.markers = m_locator.detect(captured);
    Logger::info(QStringLiteral("Detected %1 markers in %2x%3 capture for %4")
                     .arg(static_cast<int>(result.markers.size()))
                     .arg(captured.cols)
                     .arg(captured.rows)
                     .arg(QString::fromStdString(toolkit.toolkitId)));

    const RegistrationResult registration = m_registration.align(captured, result.markers,
                                                                 toolkitTemplate.referenceMarkers,
                                                                 toolkitTemplate.referenceSize);
    result.registration = registration.info();

    const ResolvedThresholds thresholds = resolveThresholds(toolkitTemplate, m_detection);

    result.verdicts.reserve(toolkitTemplate.tools.size());
    result.regions.reserve(toolkitTemplate.tools.size());
    for (const ToolDefinition &tool : toolkitTemplate.tools) {
        const Region region = registration.project(*tool.region);

        SlotVerdict verdict;
        verdict.toolId = tool.toolId;
        verdict.name = tool.name;
        verdict.slotIndex = tool.slotIndex;

        const auto metrics = m_extractor.extract(registration.image, region, thresholds);
        if (metrics) {
            const PresenceClassifier::Result classified = m_classifier.evaluate(*metrics, thresholds);
            verdict.metrics = *metrics;
            verdict.status = classified.status;
            verdict.confidence = classified.confidence;
        } else {
            verdict.status = SlotStatus::Uncertain;
            verdict.confidence = 0.0;
            verdict.note = "Region lies outside the image";
            Logger::warning(QStringLiteral("Slot %1 (%2) does not overlap the image")
                                .arg(tool.slotIndex)
                                .arg(QString::fromStdString(tool.toolId)));
        }

        Logger::debug(QStringLiteral("Slot %1 %2: %3 (%4)")
                          .arg(tool.slotIndex)
                          .arg(QString::fromStdString(tool.toolId),
                               QString::fromStdString(toString(verdict.status)))
                          .arg(verdict.confidence, 0, 'f', 3));

        result.verdicts.push_back(verdict);
        result.regions.push_back(region);
    }

    result.summary = summarize(result.verdicts);
    result.overallStatus = StatusTransitionEngine::statusFor(result.verdicts);
    result.annotatedImage = m_renderer.render(registration.image, result.verdicts, result.regions,
                                              markersInWorkingFrame(registration));

    Logger::info(QStringLiteral("Analysis of %1: %2 present, %3 missing, %4 uncertain")
                     .arg(QString::fromStdString(toolkit.toolkitId))
                     .arg(result.summary.present)
                     .arg(result.summary.missing)
                     .arg(result.summary.uncertain));
    return result;
}

} // namespace kitcheck
