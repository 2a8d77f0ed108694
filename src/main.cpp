#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>

#include <optional>

#include "AppConfig.h"
#include "CheckInService.h"
#include "ImageLoader.h"
#include "JsonCodec.h"
#include "StatusTransitionEngine.h"
#include "ToolkitAnalyzer.h"

namespace {

using namespace kitcheck;

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

void printVerdicts(QTextStream &out, const std::vector<SlotVerdict> &verdicts)
{
    for (const SlotVerdict &verdict : verdicts) {
        out << QStringLiteral("  [%1] %2 %3 %4%")
                   .arg(verdict.slotIndex, 2)
                   .arg(qs(verdict.name).leftJustified(24), qs(toString(verdict.status)).leftJustified(10))
                   .arg(verdict.confidence * 100.0, 0, 'f', 0);
        if (!verdict.note.empty()) {
            out << "  (" << qs(verdict.note) << ")";
        }
        out << Qt::endl;
    }
}

void printSummary(QTextStream &out, const CheckInSummary &summary, const RegistrationInfo &registration)
{
    out << QStringLiteral("Present: %1 | Missing: %2 | Uncertain: %3 | Total: %4")
               .arg(summary.present)
               .arg(summary.missing)
               .arg(summary.uncertain)
               .arg(summary.total)
        << Qt::endl;
    out << QStringLiteral("Markers: %1/%2, registered: %3")
               .arg(registration.markersDetected)
               .arg(registration.markersExpected)
               .arg(registration.homographyApplied ? QStringLiteral("yes") : QStringLiteral("no"));
    if (!registration.fallbackReason.empty()) {
        out << " (" << qs(registration.fallbackReason) << ")";
    }
    out << Qt::endl;
}

bool requireOption(const QCommandLineParser &parser, const QCommandLineOption &option, const QString &command)
{
    if (parser.isSet(option)) {
        return true;
    }
    QTextStream(stderr) << "Error: " << command << " requires --" << option.names().constFirst() << Qt::endl;
    return false;
}

int runAnalyze(CheckInService &service, const QString &templateId, const QString &imagePath, const QString &outputPath)
{
    QTextStream out(stdout);
    LoadedTemplate loaded;
    QString error;
    if (!service.templates().load(templateId.toStdString(), &loaded, &error)) {
        QTextStream(stderr) << "Error: " << error << Qt::endl;
        return 3;
    }

    const ImageLoader loader;
    try {
        const cv::Mat image = loader.loadImage(imagePath.toStdString());
        const Toolkit scratch = StatusTransitionEngine::initialState(loaded.toolkitTemplate, "adhoc", {});
        const AnalysisResult result = service.analyzer().analyze(loaded.toolkitTemplate, scratch, image);

        out << "Overall: " << qs(toString(result.overallStatus)) << Qt::endl;
        printVerdicts(out, result.verdicts);
        printSummary(out, result.summary, result.registration);

        if (!outputPath.isEmpty()) {
            if (!loader.saveImage(result.annotatedImage, outputPath, &error)) {
                QTextStream(stderr) << "Error: " << error << Qt::endl;
                return 4;
            }
            out << "Annotated image written to " << outputPath << Qt::endl;
        }
    } catch (const std::exception &ex) {
        QTextStream(stderr) << "Analysis failed: " << ex.what() << Qt::endl;
        return 2;
    }
    return 0;
}

int runMarkers(const CheckInService &service, const QString &imagePath)
{
    QTextStream out(stdout);
    try {
        const cv::Mat image = ImageLoader().loadImage(imagePath.toStdString());
        const std::vector<Marker> markers = service.analyzer().detectMarkers(image);
        out << "Detected " << markers.size() << " markers in " << image.cols << "x" << image.rows << Qt::endl;
        for (const Marker &marker : markers) {
            out << QStringLiteral("  id %1 (%2) center %3, %4")
                       .arg(marker.id)
                       .arg(QLatin1String(cornerName(marker.id)))
                       .arg(marker.center.x, 0, 'f', 1)
                       .arg(marker.center.y, 0, 'f', 1)
                << Qt::endl;
        }
        out << (isCompleteSet(markers) ? "Registration set complete" : "Registration set incomplete") << Qt::endl;
    } catch (const std::exception &ex) {
        QTextStream(stderr) << "Error: " << ex.what() << Qt::endl;
        return 2;
    }
    return 0;
}

int runCheckIn(CheckInService &service,
               const QString &toolkitId,
               const QString &imagePath,
               const QString &note,
               const QString &actor)
{
    QFile file(imagePath);
    if (!file.open(QIODevice::ReadOnly)) {
        QTextStream(stderr) << "Error: cannot read " << imagePath << ": " << file.errorString() << Qt::endl;
        return 3;
    }
    const QByteArray bytes = file.readAll();

    QFuture<CheckInOutcome> future =
        service.submitCheckIn(toolkitId.toStdString(), bytes, note.toStdString(), actor.toStdString());
    const CheckInOutcome outcome = future.result();
    if (!outcome.success) {
        QTextStream(stderr) << "Check-in failed [" << toString(outcome.error) << "]: " << outcome.message << Qt::endl;
        return 2;
    }

    QTextStream out(stdout);
    out << outcome.message << Qt::endl;
    printVerdicts(out, outcome.record.verdicts);
    printSummary(out, outcome.record.summary, outcome.record.registration);
    if (!outcome.record.annotatedImagePath.empty()) {
        out << "Annotated image: " << qs(outcome.record.annotatedImagePath) << Qt::endl;
    }
    return 0;
}

int runReference(CheckInService &service, const QString &templateId, const QString &imagePath)
{
    QFile file(imagePath);
    if (!file.open(QIODevice::ReadOnly)) {
        QTextStream(stderr) << "Error: cannot read " << imagePath << ": " << file.errorString() << Qt::endl;
        return 3;
    }

    const TemplateOutcome outcome = service.setReferenceImage(templateId.toStdString(), file.readAll());
    if (!outcome.success) {
        QTextStream(stderr) << "Error [" << toString(outcome.error) << "]: " << outcome.message << Qt::endl;
        return outcome.error == ServiceError::Storage ? 4 : 2;
    }

    const ToolkitTemplate &tpl = outcome.toolkitTemplate;
    QTextStream(stdout) << outcome.message << ": " << templateId
                        << QStringLiteral(" %1x%2, %3 markers")
                               .arg(tpl.referenceSize.width)
                               .arg(tpl.referenceSize.height)
                               .arg(static_cast<int>(tpl.referenceMarkers.size()))
                        << Qt::endl;
    return 0;
}

int reportToolkit(const ToolkitOutcome &outcome)
{
    if (!outcome.success) {
        QTextStream(stderr) << "Error [" << toString(outcome.error) << "]: " << outcome.message << Qt::endl;
        return outcome.error == ServiceError::Rejected ? 5 : 2;
    }
    QTextStream out(stdout);
    out << outcome.message << ": " << qs(outcome.toolkit.toolkitId) << " is " << qs(toString(outcome.toolkit.status));
    if (!outcome.toolkit.location.empty()) {
        out << " at " << qs(outcome.toolkit.location);
    }
    out << Qt::endl;
    return 0;
}

int runHistory(const CheckInService &service, const QString &toolkitId, int limit)
{
    QTextStream out(stdout);
    const std::vector<CheckInRecord> records = service.history(toolkitId.toStdString(), limit);
    if (records.empty()) {
        out << "No check-ins recorded for " << toolkitId << Qt::endl;
        return 0;
    }
    for (const CheckInRecord &record : records) {
        out << json::formatDateTime(record.timestamp) << "  " << qs(record.checkinId) << "  "
            << qs(toString(record.status))
            << QStringLiteral("  %1/%2 present").arg(record.summary.present).arg(record.summary.total);
        if (!record.actor.empty()) {
            out << "  by " << qs(record.actor);
        }
        out << Qt::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("kitcheck"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Toolkit check-in verification from foam-insert photos"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("analyze | markers | reference | enroll | checkin | checkout | history | rebuild"));

    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("JSON configuration file."), QStringLiteral("file"));
    QCommandLineOption dataOption({QStringLiteral("d"), QStringLiteral("data")},
                                  QStringLiteral("Data directory (overrides configuration)."), QStringLiteral("dir"));
    QCommandLineOption templateOption({QStringLiteral("t"), QStringLiteral("template")},
                                      QStringLiteral("Template identifier."), QStringLiteral("id"));
    QCommandLineOption toolkitOption({QStringLiteral("k"), QStringLiteral("toolkit")},
                                     QStringLiteral("Toolkit identifier."), QStringLiteral("id"));
    QCommandLineOption imageOption({QStringLiteral("i"), QStringLiteral("image")},
                                   QStringLiteral("Captured image file."), QStringLiteral("file"));
    QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                    QStringLiteral("Where to write the annotated image."), QStringLiteral("file"));
    QCommandLineOption noteOption(QStringLiteral("note"), QStringLiteral("Check-in note."), QStringLiteral("text"));
    QCommandLineOption actorOption(QStringLiteral("actor"), QStringLiteral("Who performed the check-in."),
                                   QStringLiteral("name"));
    QCommandLineOption locationOption(QStringLiteral("location"), QStringLiteral("Toolkit location or assignee."),
                                      QStringLiteral("text"));
    QCommandLineOption limitOption({QStringLiteral("n"), QStringLiteral("limit")},
                                   QStringLiteral("Maximum history entries (default 10)."), QStringLiteral("count"),
                                   QStringLiteral("10"));
    QCommandLineOption nameOption(QStringLiteral("name"), QStringLiteral("Toolkit display name."),
                                  QStringLiteral("text"));

    parser.addOptions({configOption, dataOption, templateOption, toolkitOption, imageOption, outputOption,
                       noteOption, actorOption, locationOption, limitOption, nameOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }
    const QString command = positional.constFirst();

    kitcheck::AppConfig config;
    QString error;
    if (!kitcheck::AppConfig::load(parser.value(configOption), &config, &error)) {
        QTextStream(stderr) << "Error: " << error << Qt::endl;
        return 1;
    }
    if (parser.isSet(dataOption)) {
        config.dataDirectory = parser.value(dataOption);
    }

    kitcheck::CheckInService service(config);
    const std::string toolkitId = parser.value(toolkitOption).toStdString();

    if (command == QLatin1String("analyze")) {
        if (!requireOption(parser, templateOption, command) || !requireOption(parser, imageOption, command)) {
            return 1;
        }
        return runAnalyze(service, parser.value(templateOption), parser.value(imageOption), parser.value(outputOption));
    }
    if (command == QLatin1String("markers")) {
        if (!requireOption(parser, imageOption, command)) {
            return 1;
        }
        return runMarkers(service, parser.value(imageOption));
    }
    if (command == QLatin1String("reference")) {
        if (!requireOption(parser, templateOption, command) || !requireOption(parser, imageOption, command)) {
            return 1;
        }
        return runReference(service, parser.value(templateOption), parser.value(imageOption));
    }
    if (command == QLatin1String("enroll")) {
        if (!requireOption(parser, templateOption, command) || !requireOption(parser, toolkitOption, command)) {
            return 1;
        }
        return reportToolkit(service.enroll(parser.value(templateOption).toStdString(), toolkitId,
                                            parser.value(nameOption).toStdString(),
                                            parser.value(locationOption).toStdString()));
    }
    if (command == QLatin1String("checkin")) {
        if (!requireOption(parser, toolkitOption, command) || !requireOption(parser, imageOption, command)) {
            return 1;
        }
        return runCheckIn(service, parser.value(toolkitOption), parser.value(imageOption), parser.value(noteOption),
                          parser.value(actorOption));
    }
    if (command == QLatin1String("checkout")) {
        if (!requireOption(parser, toolkitOption, command)) {
            return 1;
        }
        std::optional<std::string> location;
        if (parser.isSet(locationOption)) {
            location = parser.value(locationOption).toStdString();
        }
        return reportToolkit(service.checkout(toolkitId, location));
    }
    if (command == QLatin1String("history")) {
        if (!requireOption(parser, toolkitOption, command)) {
            return 1;
        }
        bool ok = false;
        const int limit = parser.value(limitOption).toInt(&ok);
        if (!ok || limit <= 0) {
            QTextStream(stderr) << "Invalid value for --limit: " << parser.value(limitOption) << Qt::endl;
            return 1;
        }
        return runHistory(service, parser.value(toolkitOption), limit);
    }
    if (command == QLatin1String("rebuild")) {
        if (!requireOption(parser, toolkitOption, command)) {
            return 1;
        }
        return reportToolkit(service.rebuild(toolkitId));
    }

    QTextStream(stderr) << "Unknown command: " << command << Qt::endl;
    parser.showHelp(1);
}
