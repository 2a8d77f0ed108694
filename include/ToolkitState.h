#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDateTime>

#include "SlotVerdict.h"

namespace kitcheck {

// Toolkit, template and check-in ids name files in the data directory: no path separators, no "..",
// no wildcards and no leading dot.
[[nodiscard]] bool isValidId(const std::string &id);

enum class ToolkitStatus {
    NeverChecked,
    CheckedIn,
    CheckedOut,
    Incomplete
};

// One entry of the toolkit's current per-slot snapshot.
struct ToolState {
    std::string toolId;
    std::string name;
    std::optional<SlotStatus> status; // nullopt until the first check-in
    double confidence {0.0};
    QDateTime lastSeen;
};

struct Toolkit {
    std::string toolkitId;
    std::string templateId;
    std::string name;
    std::string description;
    ToolkitStatus status {ToolkitStatus::NeverChecked};
    std::string location;
    std::vector<ToolState> toolStates;
    QDateTime lastCheckIn;
    QDateTime lastCheckOut;
    QDateTime createdAt;
    QDateTime updatedAt;
};

struct CheckInSummary {
    int present {0};
    int missing {0};
    int uncertain {0};
    int total {0};

    [[nodiscard]] bool isComplete() const { return missing == 0 && uncertain == 0; }
};

struct RegistrationInfo {
    int markersDetected {0};
    int markersExpected {4};
    bool homographyApplied {false};
    double scaleX {1.0};
    double scaleY {1.0};
    std::string fallbackReason;
};

struct CheckInRecord {
    std::string checkinId;
    std::string toolkitId;
    std::string templateId;
    QDateTime timestamp;
    ToolkitStatus status {ToolkitStatus::Incomplete};
    std::vector<SlotVerdict> verdicts;
    CheckInSummary summary;
    RegistrationInfo registration;
    std::string annotatedImagePath;
    std::string thumbnailPath;
    std::string note;
    std::string actor;
};

CheckInSummary summarize(const std::vector<SlotVerdict> &verdicts);

std::string toString(ToolkitStatus status);
ToolkitStatus toolkitStatusFromString(const std::string &value,
                                      ToolkitStatus fallback = ToolkitStatus::NeverChecked);

} // namespace kitcheck
