#pragma once

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>
#include <vector>

#include <opencv2/core.hpp>

namespace kitcheck {

struct RectRegion {
    int x {0};
    int y {0};
    int width {0};
    int height {0};
};

struct PolygonRegion {
    std::vector<cv::Point> vertices;
};

using Region = std::variant<RectRegion, PolygonRegion>;

[[nodiscard]] inline bool isPolygon(const Region &region)
{
    return std::holds_alternative<PolygonRegion>(region);
}

[[nodiscard]] inline cv::Rect boundingRect(const Region &region)
{
    return std::visit(
        [](const auto &r) -> cv::Rect {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, RectRegion>) {
                return cv::Rect(r.x, r.y, r.width, r.height);
            } else {
                if (r.vertices.empty()) {
                    return cv::Rect();
                }
                // cv::boundingRect is exclusive on the far edge
                return cv::boundingRect(r.vertices);
            }
        },
        region);
}

// Outline in drawing order; rectangles yield their four corners clockwise from top-left.
[[nodiscard]] inline std::vector<cv::Point> outline(const Region &region)
{
    return std::visit(
        [](const auto &r) -> std::vector<cv::Point> {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, RectRegion>) {
                return {cv::Point(r.x, r.y),
                        cv::Point(r.x + r.width, r.y),
                        cv::Point(r.x + r.width, r.y + r.height),
                        cv::Point(r.x, r.y + r.height)};
            } else {
                return r.vertices;
            }
        },
        region);
}

[[nodiscard]] inline Region scaled(const Region &region, double sx, double sy)
{
    return std::visit(
        [sx, sy](const auto &r) -> Region {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, RectRegion>) {
                // Corners are rounded like polygon vertices.
                RectRegion out;
                out.x = static_cast<int>(std::lround(r.x * sx));
                out.y = static_cast<int>(std::lround(r.y * sy));
                out.width = static_cast<int>(std::lround((r.x + r.width) * sx)) - out.x;
                out.height = static_cast<int>(std::lround((r.y + r.height) * sy)) - out.y;
                return out;
            } else {
                PolygonRegion out;
                out.vertices.reserve(r.vertices.size());
                for (const cv::Point &pt : r.vertices) {
                    out.vertices.emplace_back(static_cast<int>(std::lround(pt.x * sx)),
                                              static_cast<int>(std::lround(pt.y * sy)));
                }
                return out;
            }
        },
        region);
}

[[nodiscard]] inline bool isWellFormed(const Region &region)
{
    return std::visit(
        [](const auto &r) -> bool {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, RectRegion>) {
                return r.width > 0 && r.height > 0;
            } else {
                return r.vertices.size() >= 3;
            }
        },
        region);
}

} // namespace kitcheck
