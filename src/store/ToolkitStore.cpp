#include "store/ToolkitStore.h"

#include <QDir>
#include <QFileInfo>

#include "JsonCodec.h"

namespace kitcheck {

ToolkitStore::ToolkitStore(const QString &dataDirectory)
    : m_root(QDir(dataDirectory).filePath(QStringLiteral("toolkits")))
{
}

QString ToolkitStore::toolkitPath(const std::string &toolkitId) const
{
    if (!isValidId(toolkitId)) {
        return QString();
    }
    return QDir(m_root).filePath(QString::fromStdString(toolkitId) + QStringLiteral(".json"));
}

bool ToolkitStore::exists(const std::string &toolkitId) const
{
    return isValidId(toolkitId) && QFileInfo::exists(toolkitPath(toolkitId));
}

QStringList ToolkitStore::list() const
{
    QStringList ids;
    const QDir dir(m_root);
    for (const QFileInfo &info : dir.entryInfoList({QStringLiteral("*.json")}, QDir::Files, QDir::Name)) {
        ids << info.completeBaseName();
    }
    return ids;
}

bool ToolkitStore::load(const std::string &toolkitId, Toolkit *out, QString *errorMessage) const
{
    if (!exists(toolkitId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Toolkit not found: %1").arg(QString::fromStdString(toolkitId));
        }
        return false;
    }

    QJsonObject obj;
    if (!json::readObject(toolkitPath(toolkitId), &obj, errorMessage)) {
        return false;
    }
    Toolkit toolkit = json::toolkitFromJson(obj);
    if (toolkit.toolkitId.empty()) {
        toolkit.toolkitId = toolkitId;
    }
    if (out) {
        *out = std::move(toolkit);
    }
    return true;
}

bool ToolkitStore::save(const Toolkit &toolkit, QString *errorMessage) const
{
    if (!isValidId(toolkit.toolkitId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid toolkit id: '%1'").arg(QString::fromStdString(toolkit.toolkitId));
        }
        return false;
    }
    return json::writeObject(toolkitPath(toolkit.toolkitId), json::toJson(toolkit), errorMessage);
}

} // namespace kitcheck
