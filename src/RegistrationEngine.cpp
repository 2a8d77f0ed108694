#include "RegistrationEngine.h"

#include <cmath>

#include <QString>

#include <opencv2/imgproc.hpp>

#include "Logger.h"

namespace kitcheck {

namespace {
constexpr double kScaleTolerance = 0.01;
constexpr double kMinDeterminant = 1e-9;

int countRegistrationMarkers(const std::vector<Marker> &markers)
{
    int count = 0;
    for (int id : kRegistrationMarkerIds) {
        if (findMarker(markers, id)) {
            ++count;
        }
    }
    return count;
}

} // namespace

Region RegistrationResult::project(const Region &region) const
{
    if (registered || (scaleX == 1.0 && scaleY == 1.0)) {
        return region;
    }
    return scaled(region, scaleX, scaleY);
}

RegistrationInfo RegistrationResult::info() const
{
    RegistrationInfo out;
    out.markersDetected = static_cast<int>(capturedMarkers.size());
    out.markersExpected = static_cast<int>(kRegistrationMarkerIds.size());
    out.homographyApplied = registered;
    out.scaleX = scaleX;
    out.scaleY = scaleY;
    out.fallbackReason = fallbackReason;
    return out;
}

RegistrationResult RegistrationEngine::align(const cv::Mat &captured,
                                             const std::vector<Marker> &capturedMarkers,
                                             const std::vector<Marker> &referenceMarkers,
                                             const cv::Size &referenceSize) const
{
    RegistrationResult result;
    result.image = captured;
    result.capturedMarkers = capturedMarkers;

    const bool hasReferenceSize = referenceSize.width > 0 && referenceSize.height > 0;
    const int found = countRegistrationMarkers(capturedMarkers);

    if (!hasReferenceSize) {
        result.fallbackReason = "Template has no reference frame size";
    } else if (capturedMarkers.empty()) {
        result.fallbackReason = "No ArUco markers detected";
    } else if (found < static_cast<int>(kRegistrationMarkerIds.size())) {
        result.fallbackReason = "Only " + std::to_string(found) + " registration markers detected (need 4)";
    } else if (!isCompleteSet(referenceMarkers)) {
        result.fallbackReason = "Template reference markers are incomplete";
    } else {
        const cv::Mat homography = computeHomography(capturedMarkers, referenceMarkers);
        if (homography.empty()) {
            result.fallbackReason = "Failed to compute homography";
        } else {
            cv::Mat warped;
            cv::warpPerspective(captured, warped, homography, referenceSize, cv::INTER_LINEAR,
                                cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));
            result.registered = true;
            result.image = warped;
            result.homography = homography;
            Logger::info(QStringLiteral("Registered capture %1x%2 to reference %3x%4")
                             .arg(captured.cols)
                             .arg(captured.rows)
                             .arg(referenceSize.width)
                             .arg(referenceSize.height));
            return result;
        }
    }

    if (hasReferenceSize) {
        result.scaleX = fallbackScale(captured.cols, referenceSize.width);
        result.scaleY = fallbackScale(captured.rows, referenceSize.height);
    }
    Logger::warning(QStringLiteral("Registration skipped: %1 (roi scale %2 x %3)")
                        .arg(QString::fromStdString(result.fallbackReason))
                        .arg(result.scaleX, 0, 'f', 3)
                        .arg(result.scaleY, 0, 'f', 3));
    return result;
}

cv::Mat RegistrationEngine::computeHomography(const std::vector<Marker> &capturedMarkers,
                                              const std::vector<Marker> &referenceMarkers)
{
    const std::vector<cv::Point2f> src = registrationCenters(capturedMarkers);
    const std::vector<cv::Point2f> dst = registrationCenters(referenceMarkers);
    if (src.size() != 4 || dst.size() != 4) {
        return cv::Mat();
    }

    cv::Mat homography;
    try {
        homography = cv::getPerspectiveTransform(src, dst);
    } catch (const cv::Exception &ex) {
        Logger::warning(QStringLiteral("Perspective transform failed: %1").arg(QString::fromStdString(ex.what())));
        return cv::Mat();
    }

    // A singular system comes back as zeros rather than an exception.
    if (homography.empty() || std::abs(cv::determinant(homography)) < kMinDeterminant
        || !cv::checkRange(homography)) {
        return cv::Mat();
    }
    return homography;
}

std::vector<cv::Point2f> RegistrationEngine::mapToReference(const cv::Mat &homography,
                                                            const std::vector<cv::Point2f> &points)
{
    std::vector<cv::Point2f> mapped;
    if (homography.empty() || points.empty()) {
        return mapped;
    }
    cv::perspectiveTransform(points, mapped, homography);
    return mapped;
}

double RegistrationEngine::fallbackScale(int capturedExtent, int referenceExtent)
{
    if (referenceExtent <= 0 || capturedExtent <= 0) {
        return 1.0;
    }
    const double ratio = static_cast<double>(capturedExtent) / referenceExtent;
    return std::abs(ratio - 1.0) > kScaleTolerance ? ratio : 1.0;
}

} // namespace kitcheck
