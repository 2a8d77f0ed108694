#include "MarkerLocator.h"

#include <algorithm>
#include <map>

#include <QString>

#include <opencv2/imgproc.hpp>

#include "Logger.h"

namespace kitcheck {

namespace {

cv::Mat toGray(const cv::Mat &image)
{
    if (image.channels() == 1) {
        return image;
    }
    cv::Mat gray;
    if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

} // namespace

MarkerLocator::MarkerLocator(const MarkerSettings &settings)
    : m_settings(settings)
    , m_dictionary(cv::aruco::getPredefinedDictionary(dictionaryFromName(settings.dictionary)))
{
    // Relaxed for handheld photos taken at an angle
    m_parameters.adaptiveThreshWinSizeMin = m_settings.adaptiveThreshWinSizeMin;
    m_parameters.adaptiveThreshWinSizeMax = m_settings.adaptiveThreshWinSizeMax;
    m_parameters.adaptiveThreshWinSizeStep = m_settings.adaptiveThreshWinSizeStep;
    m_parameters.minMarkerPerimeterRate = m_settings.minMarkerPerimeterRate;
    m_parameters.maxMarkerPerimeterRate = m_settings.maxMarkerPerimeterRate;
    m_parameters.polygonalApproxAccuracyRate = m_settings.polygonalApproxAccuracyRate;
    m_parameters.minCornerDistanceRate = m_settings.minCornerDistanceRate;
    m_parameters.minMarkerDistanceRate = m_settings.minMarkerDistanceRate;
    m_parameters.perspectiveRemovePixelPerCell = m_settings.perspectiveRemovePixelPerCell;
    m_parameters.perspectiveRemoveIgnoredMarginPerCell = m_settings.perspectiveRemoveIgnoredMarginPerCell;
}

std::vector<Marker> MarkerLocator::detect(const cv::Mat &image) const
{
    std::vector<Marker> markers;
    if (image.empty()) {
        return markers;
    }

    std::vector<std::vector<cv::Point2f>> corners;
    std::vector<std::vector<cv::Point2f>> rejected;
    std::vector<int> ids;
    try {
        const cv::aruco::ArucoDetector detector(m_dictionary, m_parameters);
        detector.detectMarkers(toGray(image), corners, ids, rejected);
    } catch (const cv::Exception &ex) {
        Logger::warning(QStringLiteral("Marker detection failed: %1").arg(QString::fromStdString(ex.what())));
        return markers;
    }

    for (size_t i = 0; i < ids.size() && i < corners.size(); ++i) {
        const auto &c = corners[i];
        if (c.size() != 4) {
            continue;
        }
        const int id = ids[i];
        // first detection of an id wins
        if (findMarker(markers, id)) {
            continue;
        }
        markers.push_back(Marker::fromCorners(id, {c[0], c[1], c[2], c[3]}));
    }

    std::sort(markers.begin(), markers.end(), [](const Marker &a, const Marker &b) { return a.id < b.id; });
    return markers;
}

cv::aruco::PredefinedDictionaryType MarkerLocator::dictionaryFromName(const std::string &name)
{
    static const std::map<std::string, cv::aruco::PredefinedDictionaryType> kDictionaries = {
        {"DICT_4X4_50", cv::aruco::DICT_4X4_50},
        {"DICT_4X4_100", cv::aruco::DICT_4X4_100},
        {"DICT_4X4_250", cv::aruco::DICT_4X4_250},
        {"DICT_5X5_50", cv::aruco::DICT_5X5_50},
        {"DICT_5X5_100", cv::aruco::DICT_5X5_100},
        {"DICT_6X6_50", cv::aruco::DICT_6X6_50},
        {"DICT_6X6_100", cv::aruco::DICT_6X6_100},
    };

    const auto it = kDictionaries.find(name);
    if (it == kDictionaries.end()) {
        Logger::warning(QStringLiteral("Unknown marker dictionary '%1', using DICT_4X4_50")
                            .arg(QString::fromStdString(name)));
        return cv::aruco::DICT_4X4_50;
    }
    return it->second;
}

} // namespace kitcheck
