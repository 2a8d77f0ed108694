#pragma once

#include <optional>

#include <opencv2/core.hpp>

#include "DetectionSettings.h"
#include "Region.h"
#include "SlotVerdict.h"

namespace kitcheck {

class RegionSignalExtractor {
public:
    explicit RegionSignalExtractor(double cannyLow = 50.0, double cannyHigh = 150.0);

    // nullopt when the region does not overlap the image or masks to zero pixels.
    [[nodiscard]] std::optional<RegionSignals> extract(const cv::Mat &image,
                                                       const Region &region,
                                                       const ResolvedThresholds &thresholds) const;

private:
    static cv::Rect clampRoi(const cv::Rect &roi, const cv::Size &frameSize);

    double m_cannyLow {50.0};
    double m_cannyHigh {150.0};
};

} // namespace kitcheck
