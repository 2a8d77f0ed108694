#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <QString>
#include <QThreadPool>

#include "AppConfig.h"
#include "ImageLoader.h"
#include "MarkerLocator.h"
#include "StatusTransitionEngine.h"
#include "ToolkitAnalyzer.h"
#include "store/HistoryStore.h"
#include "store/TemplateStore.h"
#include "store/ToolkitStore.h"

namespace kitcheck {

enum class ServiceError {
    None,
    Configuration,
    Decode,
    NotFound,
    Conflict,
    Rejected,
    Storage,
    Internal
};

QString toString(ServiceError error);

struct CheckInOutcome {
    bool success {false};
    ServiceError error {ServiceError::None};
    QString message;
    CheckInRecord record;
    Toolkit toolkit;
    AnalysisResult analysis;
};

struct ToolkitOutcome {
    bool success {false};
    ServiceError error {ServiceError::None};
    QString message;
    Toolkit toolkit;
};

struct TemplateOutcome {
    bool success {false};
    ServiceError error {ServiceError::None};
    QString message;
    ToolkitTemplate toolkitTemplate;
};

// Ties the stores to the analysis pipeline. Requests for one toolkit are serialized; different toolkits
// run in parallel. Ids that fail isValidId() are rejected as configuration errors before any file is touched.
class CheckInService : public QObject {
    Q_OBJECT

public:
    explicit CheckInService(const AppConfig &config, QObject *parent = nullptr);
    ~CheckInService() override;

    ToolkitOutcome enroll(const std::string &templateId,
                          const std::string &toolkitId,
                          const std::string &name = {},
                          const std::string &location = {});

    CheckInOutcome checkIn(const std::string &toolkitId,
                           const QByteArray &imageBytes,
                           const std::string &note = {},
                           const std::string &actor = {});

    CheckInOutcome checkInImage(const std::string &toolkitId,
                                const cv::Mat &image,
                                const std::string &note = {},
                                const std::string &actor = {});

    // Same work as checkIn on the service's thread pool.
    QFuture<CheckInOutcome> submitCheckIn(const std::string &toolkitId,
                                          const QByteArray &imageBytes,
                                          const std::string &note = {},
                                          const std::string &actor = {});

    ToolkitOutcome checkout(const std::string &toolkitId,
                            const std::optional<std::string> &location = std::nullopt);

    // Rebuilds the stored toolkit view from its check-in history.
    ToolkitOutcome rebuild(const std::string &toolkitId);

    [[nodiscard]] std::vector<CheckInRecord> history(const std::string &toolkitId, int limit = 10) const;

    // Replaces the template's reference photo and re-detects its markers.
    TemplateOutcome setReferenceImage(const std::string &templateId, const QByteArray &imageBytes);

    // Number of per-toolkit locks held; only enrolled toolkits get one.
    [[nodiscard]] int lockedToolkitCount() const;

    void waitForIdle();

    [[nodiscard]] const AppConfig &config() const { return m_config; }
    [[nodiscard]] const TemplateStore &templates() const { return m_templates; }
    [[nodiscard]] const ToolkitStore &toolkits() const { return m_toolkits; }
    [[nodiscard]] const ToolkitAnalyzer &analyzer() const { return m_analyzer; }

Q_SIGNALS:
    void checkInFinished(const QString &toolkitId, const QString &checkinId, bool success);

private:
    std::mutex &lockFor(const std::string &toolkitId);
    void requireToolkit(const std::string &toolkitId) const;
    Toolkit loadToolkit(const std::string &toolkitId) const;
    LoadedTemplate loadTemplate(const std::string &templateId) const;
    std::string uniqueCheckInId(const std::string &toolkitId, const QDateTime &timestamp) const;
    CheckInOutcome runCheckIn(const std::string &toolkitId,
                              const cv::Mat &image,
                              const std::string &note,
                              const std::string &actor);

    AppConfig m_config;
    MarkerLocator m_locator;
    ToolkitAnalyzer m_analyzer;
    StatusTransitionEngine m_engine;
    ImageLoader m_loader;
    TemplateStore m_templates;
    ToolkitStore m_toolkits;
    HistoryStore m_history;
    QThreadPool m_pool;

    mutable std::mutex m_locksMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_toolkitLocks;
    mutable std::mutex m_templateMutex;
};

} // namespace kitcheck
