#include "AppConfig.h"

#include <QJsonObject>

#include "JsonCodec.h"
#include "Logger.h"

namespace kitcheck {

namespace {

constexpr auto kEnvPrefix = "KITCHECK_";

void readDouble(const QJsonObject &obj, const char *key, double *target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble()) {
        *target = value.toDouble();
    }
}

void readInt(const QJsonObject &obj, const char *key, int *target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble()) {
        *target = value.toInt();
    }
}

void readBool(const QJsonObject &obj, const char *key, bool *target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isBool()) {
        *target = value.toBool();
    }
}

QString envValue(const QProcessEnvironment &env, const char *name)
{
    return env.value(QLatin1String(kEnvPrefix) + QLatin1String(name));
}

void envDouble(const QProcessEnvironment &env, const char *name, double *target)
{
    const QString raw = envValue(env, name);
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const double value = raw.toDouble(&ok);
    if (!ok) {
        Logger::warning(QStringLiteral("Ignoring %1%2=%3: not a number").arg(QLatin1String(kEnvPrefix), QLatin1String(name), raw));
        return;
    }
    *target = value;
}

void envInt(const QProcessEnvironment &env, const char *name, int *target)
{
    const QString raw = envValue(env, name);
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok) {
        Logger::warning(QStringLiteral("Ignoring %1%2=%3: not an integer").arg(QLatin1String(kEnvPrefix), QLatin1String(name), raw));
        return;
    }
    *target = value;
}

void envBool(const QProcessEnvironment &env, const char *name, bool *target)
{
    const QString raw = envValue(env, name).trimmed().toLower();
    if (raw.isEmpty()) {
        return;
    }
    if (raw == QLatin1String("1") || raw == QLatin1String("true") || raw == QLatin1String("yes") || raw == QLatin1String("on")) {
        *target = true;
    } else if (raw == QLatin1String("0") || raw == QLatin1String("false") || raw == QLatin1String("no") || raw == QLatin1String("off")) {
        *target = false;
    } else {
        Logger::warning(QStringLiteral("Ignoring %1%2=%3: not a boolean").arg(QLatin1String(kEnvPrefix), QLatin1String(name), raw));
    }
}

} // namespace

bool AppConfig::loadFile(const QString &path, QString *errorMessage)
{
    QJsonObject root;
    if (!json::readObject(path, &root, errorMessage)) {
        return false;
    }

    const QString dataDir = root.value(QStringLiteral("data_dir")).toString();
    if (!dataDir.isEmpty()) {
        dataDirectory = dataDir;
    }
    readInt(root, "worker_threads", &workerThreads);

    const QJsonObject det = root.value(QStringLiteral("detection")).toObject();
    readDouble(det, "brightness_threshold", &detection.brightnessThreshold);
    readDouble(det, "saturation_threshold", &detection.saturationThreshold);
    readDouble(det, "edge_density_threshold", &detection.edgeDensityThreshold);
    readDouble(det, "occupied_ratio_threshold", &detection.occupiedRatioThreshold);
    readDouble(det, "color_ratio_threshold", &detection.colorRatioThreshold);
    readDouble(det, "canny_low", &detection.cannyLow);
    readDouble(det, "canny_high", &detection.cannyHigh);
    readDouble(det, "weight_brightness", &detection.weights.brightness);
    readDouble(det, "weight_saturation", &detection.weights.saturation);
    readDouble(det, "weight_edges", &detection.weights.edges);
    readDouble(det, "present_cutoff", &detection.presentCutoff);
    readDouble(det, "missing_cutoff", &detection.missingCutoff);
    readBool(det, "normalize_signals", &detection.normalizeSignals);

    const QJsonObject mark = root.value(QStringLiteral("markers")).toObject();
    const QString dictionary = mark.value(QStringLiteral("dictionary")).toString();
    if (!dictionary.isEmpty()) {
        markers.dictionary = dictionary.toStdString();
    }

    const QJsonObject ann = root.value(QStringLiteral("annotation")).toObject();
    readBool(ann, "draw_labels", &annotation.drawLabels);
    readBool(ann, "draw_icons", &annotation.drawIcons);
    readBool(ann, "draw_debug_metrics", &annotation.drawDebugMetrics);
    readBool(ann, "draw_markers", &annotation.drawMarkers);
    readBool(ann, "draw_summary", &annotation.drawSummary);
    readInt(ann, "thumbnail_width", &thumbnailWidth);

    Logger::info(QStringLiteral("Loaded configuration from %1").arg(path));
    return true;
}

void AppConfig::applyEnvironment(const QProcessEnvironment &env)
{
    const QString dataDir = envValue(env, "DATA_DIR");
    if (!dataDir.isEmpty()) {
        dataDirectory = dataDir;
    }
    envInt(env, "WORKER_THREADS", &workerThreads);

    envDouble(env, "BRIGHTNESS_THRESHOLD", &detection.brightnessThreshold);
    envDouble(env, "SATURATION_THRESHOLD", &detection.saturationThreshold);
    envDouble(env, "EDGE_DENSITY_THRESHOLD", &detection.edgeDensityThreshold);
    envDouble(env, "OCCUPIED_RATIO_THRESHOLD", &detection.occupiedRatioThreshold);
    envDouble(env, "COLOR_RATIO_THRESHOLD", &detection.colorRatioThreshold);
    envDouble(env, "CANNY_LOW", &detection.cannyLow);
    envDouble(env, "CANNY_HIGH", &detection.cannyHigh);
    envDouble(env, "WEIGHT_BRIGHTNESS", &detection.weights.brightness);
    envDouble(env, "WEIGHT_SATURATION", &detection.weights.saturation);
    envDouble(env, "WEIGHT_EDGES", &detection.weights.edges);
    envDouble(env, "PRESENT_CUTOFF", &detection.presentCutoff);
    envDouble(env, "MISSING_CUTOFF", &detection.missingCutoff);
    envBool(env, "NORMALIZE_SIGNALS", &detection.normalizeSignals);

    const QString dictionary = envValue(env, "ARUCO_DICTIONARY");
    if (!dictionary.isEmpty()) {
        markers.dictionary = dictionary.toStdString();
    }

    envBool(env, "DRAW_MARKERS", &annotation.drawMarkers);
    envBool(env, "DRAW_DEBUG", &annotation.drawDebugMetrics);
    envInt(env, "THUMBNAIL_WIDTH", &thumbnailWidth);
}

bool AppConfig::validate(QString *errorMessage) const
{
    QString problem;
    if (dataDirectory.isEmpty()) {
        problem = QStringLiteral("data directory is empty");
    } else if (detection.missingCutoff >= detection.presentCutoff) {
        problem = QStringLiteral("missing cutoff %1 must be below present cutoff %2")
                      .arg(detection.missingCutoff)
                      .arg(detection.presentCutoff);
    } else if (detection.cannyLow < 0.0 || detection.cannyHigh < detection.cannyLow) {
        problem = QStringLiteral("invalid Canny thresholds %1/%2").arg(detection.cannyLow).arg(detection.cannyHigh);
    } else if (thumbnailWidth <= 0) {
        problem = QStringLiteral("thumbnail width must be positive");
    }

    if (problem.isEmpty()) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = QStringLiteral("Invalid configuration: %1").arg(problem);
    }
    return false;
}

bool AppConfig::load(const QString &path, AppConfig *out, QString *errorMessage)
{
    AppConfig config;
    if (!path.isEmpty() && !config.loadFile(path, errorMessage)) {
        return false;
    }
    config.applyEnvironment();
    if (!config.validate(errorMessage)) {
        return false;
    }
    if (out) {
        *out = config;
    }
    return true;
}

} // namespace kitcheck
