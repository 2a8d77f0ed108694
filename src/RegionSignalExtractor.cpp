#include "RegionSignalExtractor.h"

#include <vector>

#include <opencv2/imgproc.hpp>

namespace kitcheck {

namespace {

cv::Mat toBgr(const cv::Mat &crop)
{
    cv::Mat bgr;
    switch (crop.channels()) {
    case 1:
        cv::cvtColor(crop, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 4:
        cv::cvtColor(crop, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        bgr = crop;
        break;
    }
    return bgr;
}

cv::Mat buildMask(const Region &region, const cv::Rect &crop)
{
    if (!isPolygon(region)) {
        return cv::Mat(crop.size(), CV_8U, cv::Scalar(255));
    }

    cv::Mat mask = cv::Mat::zeros(crop.size(), CV_8U);
    std::vector<cv::Point> shifted;
    for (const cv::Point &pt : std::get<PolygonRegion>(region).vertices) {
        shifted.push_back(pt - crop.tl());
    }
    const std::vector<std::vector<cv::Point>> polys {shifted};
    cv::fillPoly(mask, polys, cv::Scalar(255));
    return mask;
}

} // namespace

RegionSignalExtractor::RegionSignalExtractor(double cannyLow, double cannyHigh)
    : m_cannyLow(cannyLow)
    , m_cannyHigh(cannyHigh)
{
}

std::optional<RegionSignals> RegionSignalExtractor::extract(const cv::Mat &image,
                                                            const Region &region,
                                                            const ResolvedThresholds &thresholds) const
{
    if (image.empty() || !isWellFormed(region)) {
        return std::nullopt;
    }

    const cv::Rect crop = clampRoi(boundingRect(region), image.size());
    if (crop.width <= 0 || crop.height <= 0) {
        return std::nullopt;
    }

    const cv::Mat mask = buildMask(region, crop);
    const int pixelCount = cv::countNonZero(mask);
    if (pixelCount == 0) {
        return std::nullopt;
    }

    const cv::Mat bgr = toBgr(image(crop));
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
    cv::Mat saturation;
    cv::extractChannel(hsv, saturation, 1);

    cv::Mat bright = gray > thresholds.brightness;
    bright &= mask;
    cv::Mat colored = saturation > thresholds.saturation;
    colored &= mask;

    cv::Mat edges;
    cv::Canny(gray, edges, m_cannyLow, m_cannyHigh);
    edges &= mask;

    RegionSignals metrics;
    metrics.pixelCount = pixelCount;
    metrics.brightnessRatio = static_cast<double>(cv::countNonZero(bright)) / pixelCount;
    metrics.saturationRatio = static_cast<double>(cv::countNonZero(colored)) / pixelCount;
    metrics.edgeDensity = static_cast<double>(cv::countNonZero(edges)) / pixelCount;
    metrics.meanBrightness = cv::mean(gray, mask)[0];
    metrics.meanSaturation = cv::mean(saturation, mask)[0];
    return metrics;
}

cv::Rect RegionSignalExtractor::clampRoi(const cv::Rect &roi, const cv::Size &frameSize)
{
    return roi & cv::Rect(0, 0, frameSize.width, frameSize.height);
}

} // namespace kitcheck
