#pragma once

#include <string>

#include <QString>
#include <QStringList>

#include "ToolkitState.h"

namespace kitcheck {

// toolkits/<id>.json, overwritten on every state change.
class ToolkitStore {
public:
    explicit ToolkitStore(const QString &dataDirectory);

    [[nodiscard]] bool exists(const std::string &toolkitId) const;
    [[nodiscard]] QStringList list() const;

    bool load(const std::string &toolkitId, Toolkit *out, QString *errorMessage = nullptr) const;
    bool save(const Toolkit &toolkit, QString *errorMessage = nullptr) const;

    // Empty for ids that fail isValidId().
    [[nodiscard]] QString toolkitPath(const std::string &toolkitId) const;

private:
    QString m_root;
};

} // namespace kitcheck
