#include "store/HistoryStore.h"

#include <algorithm>

#include <QDir>
#include <QFileInfo>

#include "ImageLoader.h"
#include "JsonCodec.h"
#include "Logger.h"

namespace kitcheck {

HistoryStore::HistoryStore(const QString &dataDirectory)
    : m_dataRoot(QDir::cleanPath(dataDirectory))
    , m_root(QDir(dataDirectory).filePath(QStringLiteral("checkins")))
{
}

QString HistoryStore::recordPath(const std::string &checkinId) const
{
    if (!isValidId(checkinId)) {
        return QString();
    }
    return QDir(m_root).filePath(QString::fromStdString(checkinId) + QStringLiteral(".json"));
}

bool HistoryStore::contains(const std::string &checkinId) const
{
    return isValidId(checkinId) && QFileInfo::exists(recordPath(checkinId));
}

bool HistoryStore::append(const CheckInRecord &record, QString *errorMessage) const
{
    if (!isValidId(record.checkinId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid check-in id: '%1'").arg(QString::fromStdString(record.checkinId));
        }
        return false;
    }
    if (contains(record.checkinId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Check-in %1 already recorded").arg(QString::fromStdString(record.checkinId));
        }
        return false;
    }
    return json::writeObject(recordPath(record.checkinId), json::toJson(record), errorMessage);
}

std::vector<CheckInRecord> HistoryStore::listForToolkit(const std::string &toolkitId, int limit) const
{
    std::vector<CheckInRecord> records;
    if (!isValidId(toolkitId)) {
        return records;
    }
    const QDir dir(m_root);
    const QString pattern = QStringLiteral("ci_%1_*.json").arg(QString::fromStdString(toolkitId));
    for (const QFileInfo &info : dir.entryInfoList({pattern}, QDir::Files)) {
        QJsonObject obj;
        QString error;
        if (!json::readObject(info.absoluteFilePath(), &obj, &error)) {
            Logger::warning(QStringLiteral("Skipping unreadable check-in: %1").arg(error));
            continue;
        }
        CheckInRecord record = json::recordFromJson(obj);
        // the file-name prefix also matches toolkit ids that share it
        if (record.toolkitId != toolkitId) {
            continue;
        }
        records.push_back(std::move(record));
    }

    std::sort(records.begin(), records.end(), [](const CheckInRecord &a, const CheckInRecord &b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.checkinId > b.checkinId;
    });
    if (limit > 0 && static_cast<int>(records.size()) > limit) {
        records.resize(static_cast<size_t>(limit));
    }
    return records;
}

bool HistoryStore::saveImages(const std::string &checkinId,
                              const cv::Mat &annotated,
                              const cv::Mat &thumbnail,
                              std::string *annotatedPath,
                              std::string *thumbnailPath,
                              QString *errorMessage) const
{
    if (!isValidId(checkinId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid check-in id: '%1'").arg(QString::fromStdString(checkinId));
        }
        return false;
    }
    const QDir images(QDir(m_root).filePath(QStringLiteral("images")));
    const QString id = QString::fromStdString(checkinId);
    const QString fullPath = images.filePath(id + QStringLiteral(".png"));
    const QString thumbPath = images.filePath(id + QStringLiteral("_thumb.jpg"));

    const ImageLoader loader;
    if (!loader.saveImage(annotated, fullPath, errorMessage)) {
        return false;
    }
    if (!loader.saveImage(thumbnail, thumbPath, errorMessage)) {
        return false;
    }

    const QDir dataRoot(m_dataRoot);
    if (annotatedPath) {
        *annotatedPath = dataRoot.relativeFilePath(fullPath).toStdString();
    }
    if (thumbnailPath) {
        *thumbnailPath = dataRoot.relativeFilePath(thumbPath).toStdString();
    }
    return true;
}

} // namespace kitcheck
