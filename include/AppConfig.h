#pragma once

#include <QProcessEnvironment>
#include <QString>

#include "DetectionSettings.h"
#include "MarkerLocator.h"
#include "VisualizationRenderer.h"

namespace kitcheck {

// Application configuration: built-in defaults, then an optional JSON file, then KITCHECK_* variables.
struct AppConfig {
    QString dataDirectory {QStringLiteral("data")};
    DetectionSettings detection;
    MarkerSettings markers;
    AnnotationOptions annotation;
    int thumbnailWidth {150};
    int workerThreads {0}; // 0 keeps QThreadPool's default

    bool loadFile(const QString &path, QString *errorMessage = nullptr);
    void applyEnvironment(const QProcessEnvironment &env = QProcessEnvironment::systemEnvironment());
    [[nodiscard]] bool validate(QString *errorMessage = nullptr) const;

    // Defaults, then the file when given, then the process environment.
    static bool load(const QString &path, AppConfig *out, QString *errorMessage = nullptr);
};

} // namespace kitcheck
