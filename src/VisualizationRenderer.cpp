#include "VisualizationRenderer.h"

#include <algorithm>
#include <string>

#include <QString>

#include <opencv2/imgproc.hpp>

namespace kitcheck {

namespace {
constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
constexpr int kLabelPadding = 4;
constexpr int kSummaryHeight = 80;
const cv::Scalar kWhite(255, 255, 255);
const cv::Scalar kDebugBackground(60, 60, 60);
const cv::Scalar kDebugText(200, 200, 200);
const cv::Scalar kSummaryBackground(40, 40, 40);
const cv::Scalar kMarkerColor(255, 200, 0);

cv::Mat toBgrCopy(const cv::Mat &image)
{
    cv::Mat out;
    if (image.channels() == 1) {
        cv::cvtColor(image, out, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, out, cv::COLOR_BGRA2BGR);
    } else {
        out = image.clone();
    }
    return out;
}

} // namespace

VisualizationRenderer::VisualizationRenderer(const AnnotationOptions &options)
    : m_options(options)
{
}

cv::Scalar VisualizationRenderer::statusColor(SlotStatus status)
{
    switch (status) {
    case SlotStatus::Present:
        return cv::Scalar(0, 200, 0);
    case SlotStatus::Missing:
        return cv::Scalar(0, 0, 220);
    case SlotStatus::Uncertain:
        break;
    }
    return cv::Scalar(0, 165, 255);
}

cv::Scalar VisualizationRenderer::labelColor(SlotStatus status)
{
    switch (status) {
    case SlotStatus::Present:
        return cv::Scalar(0, 150, 0);
    case SlotStatus::Missing:
        return cv::Scalar(0, 0, 180);
    case SlotStatus::Uncertain:
        break;
    }
    return cv::Scalar(0, 130, 200);
}

cv::Mat VisualizationRenderer::render(const cv::Mat &image,
                                      const std::vector<SlotVerdict> &verdicts,
                                      const std::vector<Region> &regions,
                                      const std::vector<Marker> &markers) const
{
    if (image.empty()) {
        return cv::Mat();
    }
    cv::Mat canvas = toBgrCopy(image);

    const size_t count = std::min(verdicts.size(), regions.size());
    for (size_t i = 0; i < count; ++i) {
        drawRegion(canvas, regions[i], verdicts[i]);
        if (m_options.drawIcons) {
            drawStatusIcon(canvas, regions[i], verdicts[i].status);
        }
        if (m_options.drawDebugMetrics) {
            drawDebugMetrics(canvas, regions[i], verdicts[i].metrics);
        }
    }

    if (m_options.drawMarkers) {
        drawMarkers(canvas, markers);
    }
    if (m_options.drawSummary) {
        drawSummary(canvas, summarize(verdicts));
    }
    return canvas;
}

std::string VisualizationRenderer::labelText(const SlotVerdict &verdict)
{
    const std::string &name = verdict.name.empty() ? verdict.toolId : verdict.name;
    return QStringLiteral("%1 (%2%)")
        .arg(QString::fromStdString(name), QString::number(verdict.confidence * 100.0, 'f', 0))
        .toStdString();
}

std::string VisualizationRenderer::metricsText(const RegionSignals &metrics)
{
    return QStringLiteral("B:%1% S:%2% E:%3% uB:%4")
        .arg(metrics.brightnessRatio * 100.0, 0, 'f', 0)
        .arg(metrics.saturationRatio * 100.0, 0, 'f', 0)
        .arg(metrics.edgeDensity * 100.0, 0, 'f', 0)
        .arg(metrics.meanBrightness, 0, 'f', 0)
        .toStdString();
}

std::string VisualizationRenderer::summaryText(const CheckInSummary &summary)
{
    return QStringLiteral("Present: %1  |  Missing: %2  |  Uncertain: %3  |  Total: %4")
        .arg(summary.present)
        .arg(summary.missing)
        .arg(summary.uncertain)
        .arg(summary.total)
        .toStdString();
}

void VisualizationRenderer::drawRegion(cv::Mat &canvas, const Region &region, const SlotVerdict &verdict) const
{
    const cv::Scalar color = statusColor(verdict.status);
    const std::vector<std::vector<cv::Point>> contour {outline(region)};
    cv::polylines(canvas, contour, true, color, m_options.lineThickness, cv::LINE_AA);

    if (!m_options.drawLabels) {
        return;
    }

    const std::string text = labelText(verdict);

    int baseline = 0;
    const cv::Size textSize = cv::getTextSize(text, kFont, m_options.fontScale, 1, &baseline);
    const cv::Rect box = boundingRect(region);

    int top = 0;
    int textY = 0;
    if (box.y > textSize.height + kLabelPadding * 2 + 5) {
        top = box.y - textSize.height - kLabelPadding * 2;
        textY = box.y - kLabelPadding;
    } else {
        // no room above, place it under the slot
        top = box.y + box.height;
        textY = top + textSize.height + kLabelPadding;
    }

    const cv::Rect labelRect(box.x, top, textSize.width + kLabelPadding * 2, textSize.height + kLabelPadding * 2);
    cv::rectangle(canvas, labelRect, labelColor(verdict.status), cv::FILLED);
    cv::putText(canvas, text, cv::Point(box.x + kLabelPadding, textY), kFont, m_options.fontScale, kWhite, 1,
                cv::LINE_AA);
}

void VisualizationRenderer::drawStatusIcon(cv::Mat &canvas, const Region &region, SlotStatus status) const
{
    const cv::Rect box = boundingRect(region);
    const cv::Scalar color = statusColor(status);
    const cv::Point center(box.x + box.width / 2, box.y + box.height / 2);
    const int size = std::clamp(std::min(box.width, box.height) / 4, 10, 30);

    switch (status) {
    case SlotStatus::Present: {
        const std::vector<std::vector<cv::Point>> check {{
            cv::Point(center.x - size, center.y),
            cv::Point(center.x - size / 3, center.y + size / 2),
            cv::Point(center.x + size, center.y - size / 2),
        }};
        cv::polylines(canvas, check, false, color, 2, cv::LINE_AA);
        break;
    }
    case SlotStatus::Missing:
        cv::line(canvas, center + cv::Point(-size, -size), center + cv::Point(size, size), color, 2, cv::LINE_AA);
        cv::line(canvas, center + cv::Point(size, -size), center + cv::Point(-size, size), color, 2, cv::LINE_AA);
        break;
    case SlotStatus::Uncertain:
        cv::putText(canvas, "?", cv::Point(center.x - size / 2, center.y + size / 2), kFont, 1.0, color, 2,
                    cv::LINE_AA);
        break;
    }
}

void VisualizationRenderer::drawDebugMetrics(cv::Mat &canvas, const Region &region, const RegionSignals &metrics) const
{
    const std::string text = metricsText(metrics);

    constexpr double kDebugScale = 0.55;
    constexpr int kPad = 2;
    int baseline = 0;
    const cv::Size textSize = cv::getTextSize(text, kFont, kDebugScale, 1, &baseline);
    const cv::Rect box = boundingRect(region);

    const int top = box.y + box.height + 2;
    const cv::Rect background(box.x, top, textSize.width + kPad * 2, textSize.height + kPad * 2);
    cv::rectangle(canvas, background, kDebugBackground, cv::FILLED);
    cv::putText(canvas, text, cv::Point(box.x + kPad, top + textSize.height + kPad), kFont, kDebugScale,
                kDebugText, 1, cv::LINE_AA);
}

void VisualizationRenderer::drawMarkers(cv::Mat &canvas, const std::vector<Marker> &markers) const
{
    for (const Marker &marker : markers) {
        std::vector<cv::Point> pts;
        for (const cv::Point2f &corner : marker.corners) {
            pts.emplace_back(cvRound(corner.x), cvRound(corner.y));
        }
        const std::vector<std::vector<cv::Point>> contour {pts};
        cv::polylines(canvas, contour, true, kMarkerColor, 2, cv::LINE_AA);
        cv::circle(canvas, pts.front(), 4, kMarkerColor, cv::FILLED);

        const std::string label = std::to_string(marker.id);
        cv::putText(canvas, label, cv::Point(cvRound(marker.center.x), cvRound(marker.center.y)), kFont, 0.6,
                    kMarkerColor, 2, cv::LINE_AA);
    }
}

void VisualizationRenderer::drawSummary(cv::Mat &canvas, const CheckInSummary &summary) const
{
    const int height = std::min(kSummaryHeight, canvas.rows);
    if (height <= 0) {
        return;
    }

    cv::Mat band = canvas(cv::Rect(0, canvas.rows - height, canvas.cols, height));
    const cv::Mat shade(band.size(), band.type(), kSummaryBackground);
    cv::addWeighted(shade, 0.7, band, 0.3, 0.0, band);

    const int y = canvas.rows - height + 30;
    const bool complete = summary.isComplete();
    cv::putText(canvas, complete ? "COMPLETE" : "INCOMPLETE", cv::Point(20, y), kFont, 0.8,
                statusColor(complete ? SlotStatus::Present : SlotStatus::Missing), 2, cv::LINE_AA);

    cv::putText(canvas, summaryText(summary), cv::Point(20, y + 35), kFont, 0.5, kDebugText, 1, cv::LINE_AA);
}

} // namespace kitcheck
