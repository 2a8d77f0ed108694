#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "Marker.h"
#include "Region.h"
#include "ToolkitState.h"

namespace kitcheck {

struct RegistrationResult {
    bool registered {false};
    cv::Mat image;      // working image: warped when registered, the capture otherwise
    cv::Mat homography; // 3x3 CV_64F, empty when not registered
    std::vector<Marker> capturedMarkers;
    double scaleX {1.0};
    double scaleY {1.0};
    std::string fallbackReason;

    // Maps a region authored in the reference frame into the working image.
    [[nodiscard]] Region project(const Region &region) const;
    [[nodiscard]] RegistrationInfo info() const;
};

class RegistrationEngine {
public:
    RegistrationEngine() = default;

    // Never throws for missing or unusable markers; the result carries the fallback reason instead.
    [[nodiscard]] RegistrationResult align(const cv::Mat &captured,
                                           const std::vector<Marker> &capturedMarkers,
                                           const std::vector<Marker> &referenceMarkers,
                                           const cv::Size &referenceSize) const;

    // Captured-to-reference transform from marker centers 0..3. Empty when a set is incomplete or the
    // four centers are degenerate.
    [[nodiscard]] static cv::Mat computeHomography(const std::vector<Marker> &capturedMarkers,
                                                   const std::vector<Marker> &referenceMarkers);

    [[nodiscard]] static std::vector<cv::Point2f> mapToReference(const cv::Mat &homography,
                                                                 const std::vector<cv::Point2f> &points);

    // Fallback ROI scale; 1.0 when the ratio is within 1%.
    [[nodiscard]] static double fallbackScale(int capturedExtent, int referenceExtent);
};

} // namespace kitcheck
