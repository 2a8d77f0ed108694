#include "store/TemplateStore.h"

#include <QDir>
#include <QFileInfo>

#include "ImageLoader.h"
#include "JsonCodec.h"
#include "Logger.h"
#include "MarkerLocator.h"
#include "ToolkitState.h"

namespace kitcheck {

TemplateStore::TemplateStore(const QString &dataDirectory, const MarkerLocator *locator)
    : m_root(QDir(dataDirectory).filePath(QStringLiteral("templates")))
    , m_locator(locator)
{
}

QString TemplateStore::templatePath(const std::string &templateId) const
{
    if (!isValidId(templateId)) {
        return QString();
    }
    return QDir(m_root).filePath(QString::fromStdString(templateId) + QStringLiteral(".json"));
}

QString TemplateStore::defaultImagePath(const std::string &templateId) const
{
    if (!isValidId(templateId)) {
        return QString();
    }
    return QDir(m_root).filePath(QStringLiteral("images/") + QString::fromStdString(templateId) + QStringLiteral(".png"));
}

bool TemplateStore::exists(const std::string &templateId) const
{
    return isValidId(templateId) && QFileInfo::exists(templatePath(templateId));
}

QStringList TemplateStore::list() const
{
    QStringList ids;
    const QDir dir(m_root);
    for (const QFileInfo &info : dir.entryInfoList({QStringLiteral("*.json")}, QDir::Files, QDir::Name)) {
        ids << info.completeBaseName();
    }
    return ids;
}

QString TemplateStore::resolveImagePath(const ToolkitTemplate &toolkitTemplate) const
{
    if (!toolkitTemplate.referenceImagePath.empty()) {
        const QString stored = QString::fromStdString(toolkitTemplate.referenceImagePath);
        const QFileInfo info(stored);
        // relative paths are kept relative to the templates directory
        return info.isAbsolute() ? stored : QDir(m_root).filePath(stored);
    }
    const QString fallback = defaultImagePath(toolkitTemplate.templateId);
    return !fallback.isEmpty() && QFileInfo::exists(fallback) ? fallback : QString();
}

bool TemplateStore::load(const std::string &templateId, LoadedTemplate *out, QString *errorMessage) const
{
    if (!exists(templateId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Template not found: %1").arg(QString::fromStdString(templateId));
        }
        return false;
    }

    QJsonObject obj;
    if (!json::readObject(templatePath(templateId), &obj, errorMessage)) {
        return false;
    }

    LoadedTemplate loaded;
    loaded.toolkitTemplate = json::templateFromJson(obj);
    if (loaded.toolkitTemplate.templateId.empty()) {
        loaded.toolkitTemplate.templateId = templateId;
    }

    const QString imagePath = resolveImagePath(loaded.toolkitTemplate);
    if (!imagePath.isEmpty() && QFileInfo::exists(imagePath)) {
        try {
            loaded.referenceImage = ImageLoader().loadImage(imagePath.toStdString());
        } catch (const std::exception &ex) {
            Logger::warning(QStringLiteral("Reference image for %1 unreadable: %2")
                                .arg(QString::fromStdString(templateId), QString::fromStdString(ex.what())));
        }
    }

    ToolkitTemplate &tpl = loaded.toolkitTemplate;
    if (!loaded.referenceImage.empty()) {
        bool dirty = false;
        if (!tpl.hasReferenceFrame()) {
            tpl.referenceSize = loaded.referenceImage.size();
            dirty = true;
        }
        if (tpl.referenceMarkers.empty() && m_locator) {
            tpl.referenceMarkers = m_locator->detect(loaded.referenceImage);
            Logger::info(QStringLiteral("Detected %1 reference markers for template %2")
                             .arg(static_cast<int>(tpl.referenceMarkers.size()))
                             .arg(QString::fromStdString(templateId)));
            dirty = dirty || !tpl.referenceMarkers.empty();
        }
        if (dirty) {
            QString saveError;
            if (!save(tpl, &saveError)) {
                Logger::warning(QStringLiteral("Could not update template %1: %2")
                                    .arg(QString::fromStdString(templateId), saveError));
            }
        }
    }

    if (out) {
        *out = std::move(loaded);
    }
    return true;
}

bool TemplateStore::save(const ToolkitTemplate &toolkitTemplate, QString *errorMessage) const
{
    if (!isValidId(toolkitTemplate.templateId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid template id: '%1'").arg(QString::fromStdString(toolkitTemplate.templateId));
        }
        return false;
    }
    return json::writeObject(templatePath(toolkitTemplate.templateId), json::toJson(toolkitTemplate), errorMessage);
}

bool TemplateStore::saveReferenceImage(ToolkitTemplate *toolkitTemplate, const cv::Mat &image, QString *errorMessage) const
{
    if (!toolkitTemplate || !isValidId(toolkitTemplate->templateId)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid template id");
        }
        return false;
    }
    const QString path = defaultImagePath(toolkitTemplate->templateId);
    if (!ImageLoader().saveImage(image, path, errorMessage)) {
        return false;
    }
    toolkitTemplate->referenceImagePath = QDir(m_root).relativeFilePath(path).toStdString();
    toolkitTemplate->referenceSize = image.size();
    if (m_locator) {
        toolkitTemplate->referenceMarkers = m_locator->detect(image);
    }
    return save(*toolkitTemplate, errorMessage);
}

} // namespace kitcheck
