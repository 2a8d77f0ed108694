#include <QtTest>

#include <opencv2/imgproc.hpp>

#include "DetectionSettings.h"
#include "RegionSignalExtractor.h"
#include "ToolkitTemplate.h"

using namespace kitcheck;

class RegionSignalsTest : public QObject {
    Q_OBJECT

private:
    static cv::Mat solid(int width, int height, const cv::Scalar &bgr)
    {
        return cv::Mat(height, width, CV_8UC3, bgr);
    }

    static Region rect(int x, int y, int w, int h)
    {
        return RectRegion {x, y, w, h};
    }

    RegionSignalExtractor m_extractor;
    ResolvedThresholds m_thresholds;

private Q_SLOTS:
    void uniformWhiteIsBrightWithoutEdges()
    {
        const auto metrics = m_extractor.extract(solid(100, 100, cv::Scalar(255, 255, 255)), rect(10, 10, 50, 50),
                                                 m_thresholds);
        QVERIFY(metrics.has_value());
        QCOMPARE(metrics->pixelCount, 2500);
        QCOMPARE(metrics->brightnessRatio, 1.0);
        QCOMPARE(metrics->saturationRatio, 0.0);
        QCOMPARE(metrics->edgeDensity, 0.0);
        QCOMPARE(metrics->meanBrightness, 255.0);
    }

    void darkFoamIsEmpty()
    {
        const auto metrics = m_extractor.extract(solid(100, 100, cv::Scalar(10, 10, 10)), rect(0, 0, 100, 100),
                                                 m_thresholds);
        QVERIFY(metrics.has_value());
        QCOMPARE(metrics->brightnessRatio, 0.0);
        QCOMPARE(metrics->saturationRatio, 0.0);
        QCOMPARE(metrics->edgeDensity, 0.0);
        QVERIFY(qAbs(metrics->meanBrightness - 10.0) < 0.5);
    }

    void saturatedColorCounts()
    {
        // pure red: gray level 76 and full saturation
        const auto metrics = m_extractor.extract(solid(60, 60, cv::Scalar(0, 0, 255)), rect(5, 5, 40, 40),
                                                 m_thresholds);
        QVERIFY(metrics.has_value());
        QCOMPARE(metrics->brightnessRatio, 1.0);
        QCOMPARE(metrics->saturationRatio, 1.0);
        QVERIFY(metrics->meanSaturation > 250.0);
    }

    void brightnessUsesStrictThreshold()
    {
        ResolvedThresholds thresholds;
        thresholds.brightness = 60.0;
        const auto atThreshold = m_extractor.extract(solid(20, 20, cv::Scalar(60, 60, 60)), rect(0, 0, 20, 20),
                                                     thresholds);
        QVERIFY(atThreshold.has_value());
        QCOMPARE(atThreshold->brightnessRatio, 0.0);

        const auto above = m_extractor.extract(solid(20, 20, cv::Scalar(61, 61, 61)), rect(0, 0, 20, 20), thresholds);
        QVERIFY(above.has_value());
        QCOMPARE(above->brightnessRatio, 1.0);
    }

    void edgesAreDetectedAcrossBoundaries()
    {
        cv::Mat image = solid(100, 100, cv::Scalar(0, 0, 0));
        cv::rectangle(image, cv::Rect(50, 0, 50, 100), cv::Scalar(255, 255, 255), cv::FILLED);
        const auto metrics = m_extractor.extract(image, rect(20, 20, 60, 60), m_thresholds);
        QVERIFY(metrics.has_value());
        QVERIFY(metrics->edgeDensity > 0.0);
        QVERIFY(metrics->edgeDensity < 0.2);
        QVERIFY(qAbs(metrics->brightnessRatio - 0.5) < 0.02);
    }

    void regionIsClippedToImage()
    {
        const auto metrics = m_extractor.extract(solid(100, 100, cv::Scalar(255, 255, 255)), rect(80, 80, 50, 50),
                                                 m_thresholds);
        QVERIFY(metrics.has_value());
        QCOMPARE(metrics->pixelCount, 400);
    }

    void regionOutsideImageFails()
    {
        QVERIFY(!m_extractor.extract(solid(100, 100, cv::Scalar(255, 255, 255)), rect(200, 200, 20, 20), m_thresholds));
        QVERIFY(!m_extractor.extract(solid(100, 100, cv::Scalar(255, 255, 255)), rect(-50, 0, 40, 40), m_thresholds));
        QVERIFY(!m_extractor.extract(cv::Mat(), rect(0, 0, 10, 10), m_thresholds));
    }

    void polygonMasksOutsidePixels()
    {
        // left half white, right half black; triangle covers only the white side
        cv::Mat image = solid(100, 100, cv::Scalar(0, 0, 0));
        cv::rectangle(image, cv::Rect(0, 0, 50, 100), cv::Scalar(255, 255, 255), cv::FILLED);

        PolygonRegion triangle;
        triangle.vertices = {cv::Point(5, 5), cv::Point(45, 5), cv::Point(5, 90)};
        const auto metrics = m_extractor.extract(image, triangle, m_thresholds);
        QVERIFY(metrics.has_value());
        QVERIFY(metrics->pixelCount > 0);
        QVERIFY(metrics->pixelCount < 41 * 86);
        QCOMPARE(metrics->brightnessRatio, 1.0);

        // the bounding box alone would reach into the black half
        PolygonRegion wide;
        wide.vertices = {cv::Point(10, 10), cv::Point(45, 10), cv::Point(45, 40), cv::Point(90, 90), cv::Point(10, 40)};
        const auto mixed = m_extractor.extract(image, wide, m_thresholds);
        QVERIFY(mixed.has_value());
        QVERIFY(mixed->brightnessRatio > 0.5);
        QVERIFY(mixed->brightnessRatio < 1.0);
    }

    void grayscaleInputIsAccepted()
    {
        const cv::Mat gray(50, 50, CV_8UC1, cv::Scalar(200));
        const auto metrics = m_extractor.extract(gray, rect(0, 0, 50, 50), m_thresholds);
        QVERIFY(metrics.has_value());
        QCOMPARE(metrics->brightnessRatio, 1.0);
        QCOMPARE(metrics->saturationRatio, 0.0);
    }

    void templateOverridesThreshold()
    {
        ToolkitTemplate tpl;
        tpl.thresholds.brightness = 250.0;
        const DetectionSettings defaults;
        QCOMPARE(resolveThreshold(tpl, ThresholdKey::Brightness, defaults), 250.0);
        QCOMPARE(resolveThreshold(tpl, ThresholdKey::Saturation, defaults), 40.0);
        QCOMPARE(resolveThreshold(tpl, ThresholdKey::OccupiedRatio, defaults), 0.25);

        const ResolvedThresholds resolved = resolveThresholds(tpl, defaults);
        const auto metrics = m_extractor.extract(solid(30, 30, cv::Scalar(200, 200, 200)), rect(0, 0, 30, 30), resolved);
        QVERIFY(metrics.has_value());
        QCOMPARE(metrics->brightnessRatio, 0.0);
    }
};

QTEST_GUILESS_MAIN(RegionSignalsTest)
#include "tst_region_signals.moc"
