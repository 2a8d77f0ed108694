#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "Marker.h"
#include "Region.h"
#include "SlotVerdict.h"
#include "ToolkitState.h"

namespace kitcheck {

struct AnnotationOptions {
    bool drawLabels {true};
    bool drawIcons {true};
    bool drawDebugMetrics {true};
    bool drawMarkers {false};
    bool drawSummary {true};
    int lineThickness {3};
    double fontScale {0.7};
};

class VisualizationRenderer {
public:
    explicit VisualizationRenderer(const AnnotationOptions &options = AnnotationOptions());

    // Returns an annotated BGR copy; the input is never modified. regions[i] belongs to verdicts[i].
    [[nodiscard]] cv::Mat render(const cv::Mat &image,
                                 const std::vector<SlotVerdict> &verdicts,
                                 const std::vector<Region> &regions,
                                 const std::vector<Marker> &markers = {}) const;

    void drawRegion(cv::Mat &canvas, const Region &region, const SlotVerdict &verdict) const;
    void drawStatusIcon(cv::Mat &canvas, const Region &region, SlotStatus status) const;
    void drawDebugMetrics(cv::Mat &canvas, const Region &region, const RegionSignals &metrics) const;
    void drawMarkers(cv::Mat &canvas, const std::vector<Marker> &markers) const;
    void drawSummary(cv::Mat &canvas, const CheckInSummary &summary) const;

    static cv::Scalar statusColor(SlotStatus status);
    static cv::Scalar labelColor(SlotStatus status);

    // "<name> (NN%)"
    static std::string labelText(const SlotVerdict &verdict);
    static std::string metricsText(const RegionSignals &metrics);
    static std::string summaryText(const CheckInSummary &summary);

private:
    AnnotationOptions m_options;
};

} // namespace kitcheck
