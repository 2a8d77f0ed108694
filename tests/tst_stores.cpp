#include <QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "AppConfig.h"
#include "Errors.h"
#include "ImageLoader.h"
#include "JsonCodec.h"
#include "MarkerLocator.h"
#include "StatusTransitionEngine.h"
#include "TestImages.h"
#include "store/HistoryStore.h"
#include "store/TemplateStore.h"
#include "store/ToolkitStore.h"

using namespace kitcheck;

namespace {

void writeJson(const QString &path, const QJsonObject &obj)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(QJsonDocument(obj).toJson());
}

QJsonObject roi(int x, int y, int w, int h)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("x"), x);
    obj.insert(QStringLiteral("y"), y);
    obj.insert(QStringLiteral("width"), w);
    obj.insert(QStringLiteral("height"), h);
    return obj;
}

QDateTime at(const char *iso)
{
    return QDateTime::fromString(QString::fromLatin1(iso), Qt::ISODateWithMs);
}

QJsonArray pair(double x, double y)
{
    return QJsonArray {x, y};
}

CheckInRecord makeRecord(const std::string &toolkitId, const QDateTime &timestamp)
{
    CheckInRecord record;
    record.toolkitId = toolkitId;
    record.templateId = "TPL";
    record.timestamp = timestamp;
    record.checkinId = StatusTransitionEngine::makeCheckInId(toolkitId, timestamp);
    record.status = ToolkitStatus::CheckedIn;
    SlotVerdict verdict;
    verdict.toolId = "wrench";
    verdict.name = "Wrench";
    verdict.slotIndex = 1;
    verdict.status = SlotStatus::Present;
    verdict.confidence = 0.85;
    verdict.metrics.brightnessRatio = 0.9;
    record.verdicts.push_back(verdict);
    record.summary = summarize(record.verdicts);
    return record;
}

} // namespace

class StoresTest : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString freshDataDir(const QString &name) const { return m_dir.filePath(name); }

private Q_SLOTS:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
    }

    void legacyTemplateIsRead()
    {
        const QString data = freshDataDir(QStringLiteral("legacy"));
        QJsonObject bounds;
        bounds.insert(QStringLiteral("top_left"), pair(80, 80));
        bounds.insert(QStringLiteral("top_right"), pair(720, 80));
        bounds.insert(QStringLiteral("bottom_right"), pair(720, 520));
        bounds.insert(QStringLiteral("bottom_left"), pair(80, 520));

        QJsonObject first;
        first.insert(QStringLiteral("tool_id"), QStringLiteral("wrench"));
        first.insert(QStringLiteral("name"), QStringLiteral("Wrench"));
        first.insert(QStringLiteral("roi"), roi(10, 20, 30, 40));
        QJsonObject second;
        second.insert(QStringLiteral("tool_id"), QStringLiteral("pliers"));
        second.insert(QStringLiteral("polygon"), QJsonArray {pair(0, 0), pair(50, 0), pair(25, 40)});

        QJsonObject tpl;
        tpl.insert(QStringLiteral("template_id"), QStringLiteral("LEGACY"));
        tpl.insert(QStringLiteral("name"), QStringLiteral("Legacy kit"));
        tpl.insert(QStringLiteral("foam_color"), QStringLiteral("yellow"));
        tpl.insert(QStringLiteral("image_width"), 800);
        tpl.insert(QStringLiteral("image_height"), 600);
        tpl.insert(QStringLiteral("brightness_threshold"), 90.0);
        tpl.insert(QStringLiteral("aruco_bounds"), bounds);
        tpl.insert(QStringLiteral("tools"), QJsonArray {first, second});
        writeJson(QDir(data).filePath(QStringLiteral("templates/LEGACY.json")), tpl);

        const TemplateStore store(data);
        QVERIFY(store.exists("LEGACY"));
        QCOMPARE(store.list(), QStringList {QStringLiteral("LEGACY")});

        LoadedTemplate loaded;
        QString error;
        QVERIFY2(store.load("LEGACY", &loaded, &error), qPrintable(error));
        const ToolkitTemplate &t = loaded.toolkitTemplate;
        QVERIFY(t.foamColor == FoamColor::Yellow);
        QVERIFY(t.referenceSize == cv::Size(800, 600));
        QVERIFY(loaded.referenceImage.empty());
        QVERIFY(t.thresholds.brightness.has_value());
        QCOMPARE(*t.thresholds.brightness, 90.0);
        QVERIFY(!t.thresholds.saturation.has_value());
        QCOMPARE(t.referenceMarkers.size(), size_t(4));
        QVERIFY(isCompleteSet(t.referenceMarkers));
        QCOMPARE(t.tools.size(), size_t(2));
        QCOMPARE(t.tools[0].slotIndex, 1);
        QCOMPARE(t.tools[1].slotIndex, 2);
        QVERIFY(boundingRect(*t.tools[0].region) == cv::Rect(10, 20, 30, 40));
        QVERIFY(isPolygon(*t.tools[1].region));

        DetectionSettings defaults;
        QCOMPARE(resolveThreshold(t, ThresholdKey::Brightness, defaults), 90.0);
        QCOMPARE(resolveThreshold(t, ThresholdKey::Saturation, defaults), defaults.saturationThreshold);
    }

    void toolWithoutRegionFailsValidation()
    {
        const QString data = freshDataDir(QStringLiteral("noroi"));
        QJsonObject tool;
        tool.insert(QStringLiteral("tool_id"), QStringLiteral("hammer"));
        QJsonObject tpl;
        tpl.insert(QStringLiteral("template_id"), QStringLiteral("NOROI"));
        tpl.insert(QStringLiteral("tools"), QJsonArray {tool});
        writeJson(QDir(data).filePath(QStringLiteral("templates/NOROI.json")), tpl);

        LoadedTemplate loaded;
        QVERIFY(TemplateStore(data).load("NOROI", &loaded));
        QVERIFY(!loaded.toolkitTemplate.tools[0].region.has_value());

        bool raised = false;
        try {
            loaded.toolkitTemplate.validateForAnalysis();
        } catch (const ConfigurationError &) {
            raised = true;
        }
        QVERIFY(raised);
    }

    void missingTemplateReportsError()
    {
        const TemplateStore store(freshDataDir(QStringLiteral("empty")));
        QVERIFY(!store.exists("NOPE"));
        QVERIFY(store.list().isEmpty());
        LoadedTemplate loaded;
        QString error;
        QVERIFY(!store.load("NOPE", &loaded, &error));
        QVERIFY(error.contains(QStringLiteral("NOPE")));
    }

    void referenceMarkersAreDetectedAndWrittenBack()
    {
        const QString data = freshDataDir(QStringLiteral("board"));
        cv::Mat board(600, 800, CV_8UC3, cv::Scalar(255, 255, 255));
        kitcheck::testing::drawCornerMarkers(board);

        const MarkerLocator locator;
        const TemplateStore store(data, &locator);
        QVERIFY(ImageLoader().saveImage(board, store.defaultImagePath("BOARD")));

        QJsonObject tool;
        tool.insert(QStringLiteral("tool_id"), QStringLiteral("hammer"));
        tool.insert(QStringLiteral("roi"), roi(300, 220, 200, 160));
        QJsonObject tpl;
        tpl.insert(QStringLiteral("template_id"), QStringLiteral("BOARD"));
        tpl.insert(QStringLiteral("tools"), QJsonArray {tool});
        writeJson(store.templatePath("BOARD"), tpl);

        LoadedTemplate loaded;
        QVERIFY(store.load("BOARD", &loaded));
        QVERIFY(!loaded.referenceImage.empty());
        QVERIFY(loaded.toolkitTemplate.referenceSize == cv::Size(800, 600));
        QVERIFY(isCompleteSet(loaded.toolkitTemplate.referenceMarkers));

        QJsonObject stored;
        QVERIFY(json::readObject(store.templatePath("BOARD"), &stored));
        QCOMPARE(static_cast<int>(stored.value(QStringLiteral("reference_markers")).toArray().size()), 4);
        QCOMPARE(stored.value(QStringLiteral("image_width")).toInt(), 800);
    }

    void toolkitRoundTripKeepsUnknownStates()
    {
        const QString data = freshDataDir(QStringLiteral("toolkits"));
        ToolkitTemplate tpl;
        tpl.templateId = "TPL";
        ToolDefinition a;
        a.toolId = "a";
        ToolDefinition b;
        b.toolId = "b";
        tpl.tools = {a, b};

        const QDateTime created = at("2024-03-05T14:07:09.042Z");
        Toolkit toolkit = StatusTransitionEngine::initialState(tpl, "TK", "Kit", created);
        toolkit.status = ToolkitStatus::Incomplete;
        toolkit.location = "Bay 3";
        toolkit.toolStates[0].status = SlotStatus::Present;
        toolkit.toolStates[0].confidence = 0.9;
        toolkit.toolStates[0].lastSeen = created;
        toolkit.lastCheckIn = created;

        const ToolkitStore store(data);
        QString error;
        QVERIFY2(store.save(toolkit, &error), qPrintable(error));
        QVERIFY(store.exists("TK"));

        Toolkit loaded;
        QVERIFY(store.load("TK", &loaded));
        QVERIFY(loaded.status == ToolkitStatus::Incomplete);
        QCOMPARE(loaded.location, std::string("Bay 3"));
        QCOMPARE(loaded.toolStates.size(), size_t(2));
        QVERIFY(loaded.toolStates[0].status == SlotStatus::Present);
        QVERIFY(!loaded.toolStates[1].status.has_value());
        QCOMPARE(loaded.toolStates[0].lastSeen, created);
        QCOMPARE(loaded.lastCheckIn, created);
        QVERIFY(!loaded.lastCheckOut.isValid());

        QJsonObject raw;
        QVERIFY(json::readObject(store.toolkitPath("TK"), &raw));
        raw.insert(QStringLiteral("status"), QStringLiteral("bogus"));
        writeJson(store.toolkitPath("TK"), raw);
        QVERIFY(store.load("TK", &loaded));
        QVERIFY(loaded.status == ToolkitStatus::NeverChecked);

    }

    void pathLikeIdsAreRejected()
    {
        const QString data = freshDataDir(QStringLiteral("paths"));
        const TemplateStore templates(data);
        const ToolkitStore toolkits(data);
        const HistoryStore history(data);

        ToolkitTemplate tpl;
        tpl.templateId = "T";
        QVERIFY(templates.save(tpl));

        const std::vector<std::string> bad {"../templates/T", "a/b", "a\\b", "..", ".hidden", "TK*", "TK?", "[TK]", ""};
        for (const std::string &id : bad) {
            QVERIFY2(!isValidId(id), id.c_str());
            QVERIFY(toolkits.toolkitPath(id).isEmpty());
            QVERIFY(templates.templatePath(id).isEmpty());
            QVERIFY(history.recordPath(id).isEmpty());
            QVERIFY(!toolkits.exists(id));
        }
        QVERIFY(isValidId("TK-1.v2_a"));

        Toolkit escaping;
        escaping.toolkitId = "../templates/T";
        QString error;
        QVERIFY(!toolkits.save(escaping, &error));
        QVERIFY(error.contains(QStringLiteral("Invalid toolkit id")));

        CheckInRecord record = makeRecord("TK", at("2024-01-01T08:00:00.000Z"));
        record.checkinId = "../toolkits/TK";
        QVERIFY(!history.append(record));
        QVERIFY(!history.saveImages("../x", cv::Mat(4, 4, CV_8UC3), cv::Mat(4, 4, CV_8UC3), nullptr, nullptr));
        QVERIFY(history.listForToolkit("*", 0).empty());

        LoadedTemplate loaded;
        QVERIFY(templates.load("T", &loaded));
        QCOMPARE(loaded.toolkitTemplate.templateId, std::string("T"));
    }

    void fractionalRoiIsRounded()
    {
        const QString data = freshDataDir(QStringLiteral("fraction"));
        QJsonObject box;
        box.insert(QStringLiteral("x"), 10.6);
        box.insert(QStringLiteral("y"), 20.2);
        box.insert(QStringLiteral("width"), 29.8);
        box.insert(QStringLiteral("height"), 40.0);
        QJsonObject tool;
        tool.insert(QStringLiteral("tool_id"), QStringLiteral("wrench"));
        tool.insert(QStringLiteral("roi"), box);
        QJsonObject tpl;
        tpl.insert(QStringLiteral("template_id"), QStringLiteral("FRAC"));
        tpl.insert(QStringLiteral("tools"), QJsonArray {tool});
        writeJson(QDir(data).filePath(QStringLiteral("templates/FRAC.json")), tpl);

        LoadedTemplate loaded;
        QVERIFY(TemplateStore(data).load("FRAC", &loaded));
        QVERIFY(loaded.toolkitTemplate.tools[0].region.has_value());
        QVERIFY(boundingRect(*loaded.toolkitTemplate.tools[0].region) == cv::Rect(11, 20, 30, 40));
    }

    void historyRefusesDuplicates()
    {
        const HistoryStore store(freshDataDir(QStringLiteral("dup")));
        const CheckInRecord record = makeRecord("TK", at("2024-01-01T08:00:00.000Z"));
        QVERIFY(store.append(record));
        QVERIFY(store.contains(record.checkinId));
        QString error;
        QVERIFY(!store.append(record, &error));
        QVERIFY(!error.isEmpty());

        const std::vector<CheckInRecord> records = store.listForToolkit("TK", 0);
        QCOMPARE(records.size(), size_t(1));
        const CheckInRecord &loaded = records.front();
        QCOMPARE(loaded.checkinId, record.checkinId);
        QCOMPARE(loaded.timestamp, record.timestamp);
        QCOMPARE(loaded.verdicts.size(), size_t(1));
        QVERIFY(loaded.verdicts[0].status == SlotStatus::Present);
        QCOMPARE(loaded.verdicts[0].metrics.brightnessRatio, 0.9);
        QCOMPARE(loaded.summary.present, 1);
    }

    void historyIsNewestFirstAndFiltered()
    {
        const HistoryStore store(freshDataDir(QStringLiteral("order")));
        const QDateTime base = at("2024-06-01T09:00:00.000Z");
        for (int i = 0; i < 5; ++i) {
            QVERIFY(store.append(makeRecord("TK", base.addSecs(60 * i))));
        }
        // shares the "ci_TK_" file prefix
        QVERIFY(store.append(makeRecord("TK_2", base.addSecs(3600))));

        const std::vector<CheckInRecord> all = store.listForToolkit("TK", 0);
        QCOMPARE(all.size(), size_t(5));
        for (const CheckInRecord &record : all) {
            QCOMPARE(record.toolkitId, std::string("TK"));
        }
        QCOMPARE(all.front().timestamp, base.addSecs(240));
        QCOMPARE(all.back().timestamp, base);

        const std::vector<CheckInRecord> limited = store.listForToolkit("TK", 2);
        QCOMPARE(limited.size(), size_t(2));
        QCOMPARE(limited[1].timestamp, base.addSecs(180));

        QVERIFY(store.listForToolkit("OTHER").empty());
    }

    void historyImagesAreRelativeToDataDir()
    {
        const QString data = freshDataDir(QStringLiteral("images"));
        const HistoryStore store(data);
        const cv::Mat annotated(60, 80, CV_8UC3, cv::Scalar(0, 255, 0));
        std::string annotatedPath;
        std::string thumbnailPath;
        QVERIFY(store.saveImages("ci_TK_x", annotated, annotated, &annotatedPath, &thumbnailPath));
        QCOMPARE(annotatedPath, std::string("checkins/images/ci_TK_x.png"));
        QCOMPARE(thumbnailPath, std::string("checkins/images/ci_TK_x_thumb.jpg"));
        QVERIFY(QFile::exists(QDir(data).filePath(QString::fromStdString(annotatedPath))));
        QVERIFY(QFile::exists(QDir(data).filePath(QString::fromStdString(thumbnailPath))));
    }

    void configFileThenEnvironment()
    {
        QJsonObject detection;
        detection.insert(QStringLiteral("brightness_threshold"), 75.0);
        detection.insert(QStringLiteral("present_cutoff"), 0.8);
        detection.insert(QStringLiteral("normalize_signals"), true);
        QJsonObject markers;
        markers.insert(QStringLiteral("dictionary"), QStringLiteral("DICT_5X5_100"));
        QJsonObject root;
        root.insert(QStringLiteral("data_dir"), QStringLiteral("/srv/kits"));
        root.insert(QStringLiteral("detection"), detection);
        root.insert(QStringLiteral("markers"), markers);
        const QString path = m_dir.filePath(QStringLiteral("config.json"));
        writeJson(path, root);

        AppConfig config;
        QString error;
        QVERIFY2(config.loadFile(path, &error), qPrintable(error));
        QCOMPARE(config.dataDirectory, QStringLiteral("/srv/kits"));
        QCOMPARE(config.detection.brightnessThreshold, 75.0);
        QCOMPARE(config.detection.presentCutoff, 0.8);
        QVERIFY(config.detection.normalizeSignals);
        QCOMPARE(config.markers.dictionary, std::string("DICT_5X5_100"));
        QCOMPARE(config.detection.saturationThreshold, 40.0);

        QProcessEnvironment env;
        env.insert(QStringLiteral("KITCHECK_DATA_DIR"), QStringLiteral("/tmp/kits"));
        env.insert(QStringLiteral("KITCHECK_BRIGHTNESS_THRESHOLD"), QStringLiteral("55"));
        env.insert(QStringLiteral("KITCHECK_SATURATION_THRESHOLD"), QStringLiteral("lots"));
        env.insert(QStringLiteral("KITCHECK_NORMALIZE_SIGNALS"), QStringLiteral("off"));
        env.insert(QStringLiteral("KITCHECK_DRAW_MARKERS"), QStringLiteral("maybe"));
        env.insert(QStringLiteral("KITCHECK_THUMBNAIL_WIDTH"), QStringLiteral("200"));
        config.applyEnvironment(env);

        QCOMPARE(config.dataDirectory, QStringLiteral("/tmp/kits"));
        QCOMPARE(config.detection.brightnessThreshold, 55.0);
        QCOMPARE(config.detection.saturationThreshold, 40.0);
        QVERIFY(!config.detection.normalizeSignals);
        QVERIFY(!config.annotation.drawMarkers);
        QCOMPARE(config.thumbnailWidth, 200);
        QVERIFY(config.validate(&error));
    }

    void invalidConfigIsRejected()
    {
        AppConfig config;
        QVERIFY(config.validate());

        config.detection.missingCutoff = 0.75;
        QString error;
        QVERIFY(!config.validate(&error));
        QVERIFY(!error.isEmpty());

        config = AppConfig();
        config.thumbnailWidth = 0;
        QVERIFY(!config.validate());

        config = AppConfig();
        config.dataDirectory.clear();
        QVERIFY(!config.validate());

        AppConfig unreadable;
        QVERIFY(!unreadable.loadFile(m_dir.filePath(QStringLiteral("missing.json")), &error));
    }
};

QTEST_GUILESS_MAIN(StoresTest)
#include "tst_stores.moc"
