#pragma once

#include <string>

#include <QString>
#include <QStringList>

#include <opencv2/core.hpp>

#include "ToolkitTemplate.h"

namespace kitcheck {

class MarkerLocator;

struct LoadedTemplate {
    ToolkitTemplate toolkitTemplate;
    cv::Mat referenceImage; // empty when the template has none
};

// templates/<id>.json with the reference photo under templates/images/<id>.png.
class TemplateStore {
public:
    explicit TemplateStore(const QString &dataDirectory, const MarkerLocator *locator = nullptr);

    [[nodiscard]] bool exists(const std::string &templateId) const;
    [[nodiscard]] QStringList list() const;

    // Reference markers missing from the file are detected on the reference image and written back.
    bool load(const std::string &templateId, LoadedTemplate *out, QString *errorMessage = nullptr) const;
    bool save(const ToolkitTemplate &toolkitTemplate, QString *errorMessage = nullptr) const;
    // Stores the image as templates/images/<id>.png, re-detects the reference markers and saves the template.
    bool saveReferenceImage(ToolkitTemplate *toolkitTemplate, const cv::Mat &image, QString *errorMessage = nullptr) const;

    // Both empty for ids that fail isValidId().
    [[nodiscard]] QString templatePath(const std::string &templateId) const;
    [[nodiscard]] QString defaultImagePath(const std::string &templateId) const;

private:
    [[nodiscard]] QString resolveImagePath(const ToolkitTemplate &toolkitTemplate) const;

    QString m_root;
    const MarkerLocator *m_locator {nullptr};
};

} // namespace kitcheck
