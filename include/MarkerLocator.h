#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

#include "Marker.h"

namespace kitcheck {

struct MarkerSettings {
    std::string dictionary {"DICT_4X4_50"};
    int adaptiveThreshWinSizeMin {3};
    int adaptiveThreshWinSizeMax {53};
    int adaptiveThreshWinSizeStep {4};
    double minMarkerPerimeterRate {0.01};
    double maxMarkerPerimeterRate {4.0};
    double polygonalApproxAccuracyRate {0.05};
    double minCornerDistanceRate {0.01};
    double minMarkerDistanceRate {0.01};
    int perspectiveRemovePixelPerCell {8};
    double perspectiveRemoveIgnoredMarginPerCell {0.2};
};

// Finds ArUco markers. Detection failures are soft: an empty list, never an exception.
class MarkerLocator {
public:
    explicit MarkerLocator(const MarkerSettings &settings = MarkerSettings());

    [[nodiscard]] std::vector<Marker> detect(const cv::Mat &image) const;

    [[nodiscard]] const cv::aruco::Dictionary &dictionary() const { return m_dictionary; }

    // Unknown names fall back to DICT_4X4_50.
    static cv::aruco::PredefinedDictionaryType dictionaryFromName(const std::string &name);

private:
    MarkerSettings m_settings;
    cv::aruco::Dictionary m_dictionary;
    cv::aruco::DetectorParameters m_parameters;
};

} // namespace kitcheck
