#include "CheckInService.h"

#include <algorithm>

#include <QtConcurrent/QtConcurrentRun>

#include "Errors.h"
#include "Logger.h"

namespace kitcheck {

namespace {

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

template <typename Outcome>
Outcome failure(ServiceError error, const QString &message)
{
    Outcome outcome;
    outcome.success = false;
    outcome.error = error;
    outcome.message = message;
    Logger::warning(QStringLiteral("[%1] %2").arg(toString(error), message));
    return outcome;
}

} // namespace

QString toString(ServiceError error)
{
    switch (error) {
    case ServiceError::None:
        return QStringLiteral("none");
    case ServiceError::Configuration:
        return QStringLiteral("configuration");
    case ServiceError::Decode:
        return QStringLiteral("decode");
    case ServiceError::NotFound:
        return QStringLiteral("not_found");
    case ServiceError::Conflict:
        return QStringLiteral("conflict");
    case ServiceError::Rejected:
        return QStringLiteral("rejected");
    case ServiceError::Storage:
        return QStringLiteral("storage");
    case ServiceError::Internal:
        return QStringLiteral("internal");
    }
    return QStringLiteral("internal");
}

CheckInService::CheckInService(const AppConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_locator(config.markers)
    , m_analyzer(config.detection, config.markers, config.annotation)
    , m_templates(config.dataDirectory, &m_locator)
    , m_toolkits(config.dataDirectory)
    , m_history(config.dataDirectory)
{
    if (m_config.workerThreads > 0) {
        m_pool.setMaxThreadCount(m_config.workerThreads);
    }
}

CheckInService::~CheckInService()
{
    m_pool.waitForDone();
}

void CheckInService::waitForIdle()
{
    m_pool.waitForDone();
}

std::mutex &CheckInService::lockFor(const std::string &toolkitId)
{
    std::lock_guard<std::mutex> guard(m_locksMutex);
    auto &slot = m_toolkitLocks[toolkitId];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

int CheckInService::lockedToolkitCount() const
{
    std::lock_guard<std::mutex> guard(m_locksMutex);
    return static_cast<int>(m_toolkitLocks.size());
}

void CheckInService::requireToolkit(const std::string &toolkitId) const
{
    if (!isValidId(toolkitId)) {
        throw ConfigurationError("Invalid toolkit id: '" + toolkitId + "'");
    }
    if (!m_toolkits.exists(toolkitId)) {
        throw NotFoundError("Toolkit not found: " + toolkitId);
    }
}

Toolkit CheckInService::loadToolkit(const std::string &toolkitId) const
{
    requireToolkit(toolkitId);
    Toolkit toolkit;
    QString error;
    if (!m_toolkits.load(toolkitId, &toolkit, &error)) {
        throw ConfigurationError(error.toStdString());
    }
    return toolkit;
}

LoadedTemplate CheckInService::loadTemplate(const std::string &templateId) const
{
    // loading may write detected reference markers back to the file
    std::lock_guard<std::mutex> guard(m_templateMutex);
    if (!isValidId(templateId)) {
        throw ConfigurationError("Invalid template id: '" + templateId + "'");
    }
    if (!m_templates.exists(templateId)) {
        throw NotFoundError("Template not found: " + templateId);
    }
    LoadedTemplate loaded;
    QString error;
    if (!m_templates.load(templateId, &loaded, &error)) {
        throw ConfigurationError(error.toStdString());
    }
    return loaded;
}

std::string CheckInService::uniqueCheckInId(const std::string &toolkitId, const QDateTime &timestamp) const
{
    const std::string base = StatusTransitionEngine::makeCheckInId(toolkitId, timestamp);
    std::string candidate = base;
    for (int suffix = 2; m_history.contains(candidate); ++suffix) {
        candidate = base + "_" + std::to_string(suffix);
    }
    return candidate;
}

ToolkitOutcome CheckInService::enroll(const std::string &templateId,
                                      const std::string &toolkitId,
                                      const std::string &name,
                                      const std::string &location)
{
    if (!isValidId(toolkitId)) {
        return failure<ToolkitOutcome>(ServiceError::Configuration,
                                       QStringLiteral("Invalid toolkit id: '%1'").arg(qs(toolkitId)));
    }

    try {
        const LoadedTemplate loaded = loadTemplate(templateId);

        std::lock_guard<std::mutex> guard(lockFor(toolkitId));
        if (m_toolkits.exists(toolkitId)) {
            return failure<ToolkitOutcome>(ServiceError::Conflict,
                                           QStringLiteral("Toolkit %1 already exists").arg(qs(toolkitId)));
        }

        Toolkit toolkit = StatusTransitionEngine::initialState(loaded.toolkitTemplate, toolkitId, name);
        toolkit.location = location;

        QString error;
        if (!m_toolkits.save(toolkit, &error)) {
            return failure<ToolkitOutcome>(ServiceError::Storage, error);
        }
        Logger::info(QStringLiteral("Enrolled toolkit %1 from template %2 (%3 tools)")
                         .arg(qs(toolkitId), qs(templateId))
                         .arg(static_cast<int>(toolkit.toolStates.size())));

        ToolkitOutcome outcome;
        outcome.success = true;
        outcome.message = QStringLiteral("Toolkit enrolled");
        outcome.toolkit = toolkit;
        return outcome;
    } catch (const NotFoundError &ex) {
        return failure<ToolkitOutcome>(ServiceError::NotFound, QString::fromUtf8(ex.what()));
    } catch (const ConfigurationError &ex) {
        return failure<ToolkitOutcome>(ServiceError::Configuration, QString::fromUtf8(ex.what()));
    }
}

CheckInOutcome CheckInService::checkIn(const std::string &toolkitId,
                                       const QByteArray &imageBytes,
                                       const std::string &note,
                                       const std::string &actor)
{
    cv::Mat image;
    try {
        image = m_loader.decodeImage(imageBytes);
    } catch (const DecodeError &ex) {
        CheckInOutcome outcome = failure<CheckInOutcome>(ServiceError::Decode, QString::fromUtf8(ex.what()));
        Q_EMIT checkInFinished(qs(toolkitId), QString(), false);
        return outcome;
    }
    return checkInImage(toolkitId, image, note, actor);
}

CheckInOutcome CheckInService::checkInImage(const std::string &toolkitId,
                                            const cv::Mat &image,
                                            const std::string &note,
                                            const std::string &actor)
{
    CheckInOutcome outcome;
    try {
        outcome = runCheckIn(toolkitId, image, note, actor);
    } catch (const NotFoundError &ex) {
        outcome = failure<CheckInOutcome>(ServiceError::NotFound, QString::fromUtf8(ex.what()));
    } catch (const ConfigurationError &ex) {
        outcome = failure<CheckInOutcome>(ServiceError::Configuration, QString::fromUtf8(ex.what()));
    } catch (const DecodeError &ex) {
        outcome = failure<CheckInOutcome>(ServiceError::Decode, QString::fromUtf8(ex.what()));
    } catch (const cv::Exception &ex) {
        outcome = failure<CheckInOutcome>(ServiceError::Internal, QString::fromUtf8(ex.what()));
    }

    Q_EMIT checkInFinished(qs(toolkitId), qs(outcome.record.checkinId), outcome.success);
    return outcome;
}

CheckInOutcome CheckInService::runCheckIn(const std::string &toolkitId,
                                          const cv::Mat &image,
                                          const std::string &note,
                                          const std::string &actor)
{
    requireToolkit(toolkitId);
    std::lock_guard<std::mutex> guard(lockFor(toolkitId));

    const Toolkit toolkit = loadToolkit(toolkitId);
    const LoadedTemplate loaded = loadTemplate(toolkit.templateId);

    CheckInOutcome outcome;
    outcome.analysis = m_analyzer.analyze(loaded.toolkitTemplate, toolkit, image);

    const QDateTime timestamp = QDateTime::currentDateTimeUtc();
    const std::string checkinId = uniqueCheckInId(toolkitId, timestamp);

    StatusTransitionEngine::CheckInResult transition = m_engine.checkIn(toolkit,
                                                                        outcome.analysis.verdicts,
                                                                        outcome.analysis.registration,
                                                                        timestamp,
                                                                        checkinId,
                                                                        note,
                                                                        actor);

    QString imageError;
    const cv::Mat thumbnail = m_loader.makeThumbnail(outcome.analysis.annotatedImage, m_config.thumbnailWidth);
    if (!m_history.saveImages(checkinId, outcome.analysis.annotatedImage, thumbnail,
                              &transition.record.annotatedImagePath, &transition.record.thumbnailPath,
                              &imageError)) {
        Logger::warning(QStringLiteral("Check-in %1 stored without images: %2").arg(qs(checkinId), imageError));
    }

    QString error;
    if (!m_history.append(transition.record, &error)) {
        return failure<CheckInOutcome>(ServiceError::Storage, error);
    }
    if (!m_toolkits.save(transition.toolkit, &error)) {
        return failure<CheckInOutcome>(ServiceError::Storage, error);
    }

    outcome.success = true;
    outcome.message = QStringLiteral("Check-in %1: %2").arg(qs(checkinId), qs(toString(transition.record.status)));
    outcome.record = std::move(transition.record);
    outcome.toolkit = std::move(transition.toolkit);
    return outcome;
}

QFuture<CheckInOutcome> CheckInService::submitCheckIn(const std::string &toolkitId,
                                                      const QByteArray &imageBytes,
                                                      const std::string &note,
                                                      const std::string &actor)
{
    return QtConcurrent::run(&m_pool, [this, toolkitId, imageBytes, note, actor]() {
        return checkIn(toolkitId, imageBytes, note, actor);
    });
}

ToolkitOutcome CheckInService::checkout(const std::string &toolkitId, const std::optional<std::string> &location)
{
    try {
        requireToolkit(toolkitId);
        std::lock_guard<std::mutex> guard(lockFor(toolkitId));
        const Toolkit toolkit = loadToolkit(toolkitId);
        const StatusTransitionEngine::CheckoutResult result =
            m_engine.checkout(toolkit, QDateTime::currentDateTimeUtc(), location);
        if (!result.accepted) {
            ToolkitOutcome outcome = failure<ToolkitOutcome>(ServiceError::Rejected, qs(result.reason));
            outcome.toolkit = toolkit;
            return outcome;
        }

        QString error;
        if (!m_toolkits.save(result.toolkit, &error)) {
            return failure<ToolkitOutcome>(ServiceError::Storage, error);
        }

        ToolkitOutcome outcome;
        outcome.success = true;
        outcome.message = QStringLiteral("Toolkit checked out");
        outcome.toolkit = result.toolkit;
        return outcome;
    } catch (const NotFoundError &ex) {
        return failure<ToolkitOutcome>(ServiceError::NotFound, QString::fromUtf8(ex.what()));
    } catch (const ConfigurationError &ex) {
        return failure<ToolkitOutcome>(ServiceError::Configuration, QString::fromUtf8(ex.what()));
    }
}

ToolkitOutcome CheckInService::rebuild(const std::string &toolkitId)
{
    try {
        requireToolkit(toolkitId);
        std::lock_guard<std::mutex> guard(lockFor(toolkitId));
        const Toolkit stored = loadToolkit(toolkitId);
        const LoadedTemplate loaded = loadTemplate(stored.templateId);

        std::vector<CheckInRecord> records = m_history.listForToolkit(toolkitId, 0);
        std::reverse(records.begin(), records.end());

        Toolkit initial = StatusTransitionEngine::initialState(loaded.toolkitTemplate, toolkitId, stored.name,
                                                               stored.createdAt);
        initial.description = stored.description;
        initial.location = stored.location;
        initial.lastCheckOut = stored.lastCheckOut;
        Toolkit rebuilt = StatusTransitionEngine::replay(initial, records);

        // checkouts are not part of the history; keep one that happened after the last check-in
        if (stored.status == ToolkitStatus::CheckedOut && rebuilt.status != ToolkitStatus::NeverChecked
            && stored.lastCheckOut.isValid() && stored.lastCheckOut >= rebuilt.lastCheckIn) {
            rebuilt.status = ToolkitStatus::CheckedOut;
            rebuilt.updatedAt = stored.lastCheckOut;
        }

        QString error;
        if (!m_toolkits.save(rebuilt, &error)) {
            return failure<ToolkitOutcome>(ServiceError::Storage, error);
        }
        Logger::info(QStringLiteral("Rebuilt toolkit %1 from %2 check-ins")
                         .arg(qs(toolkitId))
                         .arg(static_cast<int>(records.size())));

        ToolkitOutcome outcome;
        outcome.success = true;
        outcome.message = QStringLiteral("Toolkit rebuilt");
        outcome.toolkit = rebuilt;
        return outcome;
    } catch (const NotFoundError &ex) {
        return failure<ToolkitOutcome>(ServiceError::NotFound, QString::fromUtf8(ex.what()));
    } catch (const ConfigurationError &ex) {
        return failure<ToolkitOutcome>(ServiceError::Configuration, QString::fromUtf8(ex.what()));
    }
}

std::vector<CheckInRecord> CheckInService::history(const std::string &toolkitId, int limit) const
{
    return m_history.listForToolkit(toolkitId, limit);
}

TemplateOutcome CheckInService::setReferenceImage(const std::string &templateId, const QByteArray &imageBytes)
{
    try {
        const cv::Mat image = m_loader.decodeImage(imageBytes);
        LoadedTemplate loaded = loadTemplate(templateId);

        std::lock_guard<std::mutex> guard(m_templateMutex);
        QString error;
        if (!m_templates.saveReferenceImage(&loaded.toolkitTemplate, image, &error)) {
            return failure<TemplateOutcome>(ServiceError::Storage, error);
        }
        Logger::info(QStringLiteral("Reference image for template %1 set (%2x%3, %4 markers)")
                         .arg(qs(templateId))
                         .arg(image.cols)
                         .arg(image.rows)
                         .arg(static_cast<int>(loaded.toolkitTemplate.referenceMarkers.size())));

        TemplateOutcome outcome;
        outcome.success = true;
        outcome.message = QStringLiteral("Reference image stored");
        outcome.toolkitTemplate = std::move(loaded.toolkitTemplate);
        return outcome;
    } catch (const DecodeError &ex) {
        return failure<TemplateOutcome>(ServiceError::Decode, QString::fromUtf8(ex.what()));
    } catch (const NotFoundError &ex) {
        return failure<TemplateOutcome>(ServiceError::NotFound, QString::fromUtf8(ex.what()));
    } catch (const ConfigurationError &ex) {
        return failure<TemplateOutcome>(ServiceError::Configuration, QString::fromUtf8(ex.what()));
    } catch (const cv::Exception &ex) {
        return failure<TemplateOutcome>(ServiceError::Internal, QString::fromUtf8(ex.what()));
    }
}

} // namespace kitcheck
