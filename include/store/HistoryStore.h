#pragma once

#include <string>
#include <vector>

#include <QString>

#include <opencv2/core.hpp>

#include "ToolkitState.h"

namespace kitcheck {

// Append-only check-in log: checkins/<checkin_id>.json plus rendered images under checkins/images/.
class HistoryStore {
public:
    explicit HistoryStore(const QString &dataDirectory);

    [[nodiscard]] bool contains(const std::string &checkinId) const;

    // Refuses to overwrite an existing record.
    bool append(const CheckInRecord &record, QString *errorMessage = nullptr) const;

    // Most recent first; limit <= 0 returns everything.
    [[nodiscard]] std::vector<CheckInRecord> listForToolkit(const std::string &toolkitId, int limit = 10) const;

    // Writes <id>.png and <id>_thumb.jpg; the paths are relative to the data directory.
    bool saveImages(const std::string &checkinId,
                    const cv::Mat &annotated,
                    const cv::Mat &thumbnail,
                    std::string *annotatedPath,
                    std::string *thumbnailPath,
                    QString *errorMessage = nullptr) const;

    [[nodiscard]] QString recordPath(const std::string &checkinId) const;

private:
    QString m_dataRoot;
    QString m_root;
};

} // namespace kitcheck
