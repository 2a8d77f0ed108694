#include "ToolkitState.h"

namespace kitcheck {

bool isValidId(const std::string &id)
{
    if (id.empty() || id.front() == '.' || id.find("..") != std::string::npos) {
        return false;
    }
    return id.find_first_of("/\\*?[]") == std::string::npos;
}

std::string toString(SlotStatus status)
{
    switch (status) {
    case SlotStatus::Present:
        return "present";
    case SlotStatus::Missing:
        return "missing";
    case SlotStatus::Uncertain:
        return "uncertain";
    }
    return "uncertain";
}

std::optional<SlotStatus> slotStatusFromString(const std::string &value)
{
    if (value == "present") {
        return SlotStatus::Present;
    }
    if (value == "missing") {
        return SlotStatus::Missing;
    }
    if (value == "uncertain") {
        return SlotStatus::Uncertain;
    }
    return std::nullopt;
}

CheckInSummary summarize(const std::vector<SlotVerdict> &verdicts)
{
    CheckInSummary summary;
    summary.total = static_cast<int>(verdicts.size());
    for (const SlotVerdict &verdict : verdicts) {
        switch (verdict.status) {
        case SlotStatus::Present:
            ++summary.present;
            break;
        case SlotStatus::Missing:
            ++summary.missing;
            break;
        case SlotStatus::Uncertain:
            ++summary.uncertain;
            break;
        }
    }
    return summary;
}

std::string toString(ToolkitStatus status)
{
    switch (status) {
    case ToolkitStatus::NeverChecked:
        return "never_checked";
    case ToolkitStatus::CheckedIn:
        return "checked_in";
    case ToolkitStatus::CheckedOut:
        return "checked_out";
    case ToolkitStatus::Incomplete:
        return "incomplete";
    }
    return "never_checked";
}

ToolkitStatus toolkitStatusFromString(const std::string &value, ToolkitStatus fallback)
{
    if (value == "never_checked") {
        return ToolkitStatus::NeverChecked;
    }
    if (value == "checked_in") {
        return ToolkitStatus::CheckedIn;
    }
    if (value == "checked_out") {
        return ToolkitStatus::CheckedOut;
    }
    if (value == "incomplete") {
        return ToolkitStatus::Incomplete;
    }
    return fallback;
}

} // namespace kitcheck
