#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace kitcheck {

// Fixed corner assignment of the four registration markers.
enum class MarkerCorner {
    TopLeft = 0,
    TopRight = 1,
    BottomRight = 2,
    BottomLeft = 3
};

constexpr std::array<int, 4> kRegistrationMarkerIds {0, 1, 2, 3};

struct Marker {
    int id {-1};
    std::array<cv::Point2f, 4> corners {};
    cv::Point2f center {0.0f, 0.0f};

    static Marker fromCorners(int id, const std::array<cv::Point2f, 4> &corners);
};

inline Marker Marker::fromCorners(int markerId, const std::array<cv::Point2f, 4> &pts)
{
    Marker marker;
    marker.id = markerId;
    marker.corners = pts;
    cv::Point2f sum(0.0f, 0.0f);
    for (const cv::Point2f &pt : pts) {
        sum += pt;
    }
    marker.center = sum * 0.25f;
    return marker;
}

[[nodiscard]] inline std::optional<Marker> findMarker(const std::vector<Marker> &markers, int id)
{
    const auto it = std::find_if(markers.begin(), markers.end(), [id](const Marker &m) { return m.id == id; });
    if (it == markers.end()) {
        return std::nullopt;
    }
    return *it;
}

[[nodiscard]] inline bool isCompleteSet(const std::vector<Marker> &markers)
{
    return std::all_of(kRegistrationMarkerIds.begin(), kRegistrationMarkerIds.end(),
                       [&markers](int id) { return findMarker(markers, id).has_value(); });
}

// Centers of markers 0..3 in corner order; empty when the set is incomplete.
[[nodiscard]] inline std::vector<cv::Point2f> registrationCenters(const std::vector<Marker> &markers)
{
    std::vector<cv::Point2f> centers;
    centers.reserve(kRegistrationMarkerIds.size());
    for (int id : kRegistrationMarkerIds) {
        const auto marker = findMarker(markers, id);
        if (!marker) {
            return {};
        }
        centers.push_back(marker->center);
    }
    return centers;
}

[[nodiscard]] inline const char *cornerName(int markerId)
{
    switch (markerId) {
    case static_cast<int>(MarkerCorner::TopLeft):
        return "top_left";
    case static_cast<int>(MarkerCorner::TopRight):
        return "top_right";
    case static_cast<int>(MarkerCorner::BottomRight):
        return "bottom_right";
    case static_cast<int>(MarkerCorner::BottomLeft):
        return "bottom_left";
    default:
        return "unassigned";
    }
}

} // namespace kitcheck
