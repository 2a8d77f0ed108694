#include "StatusTransitionEngine.h"

#include <algorithm>

#include <QString>

#include "Logger.h"

namespace kitcheck {

Toolkit StatusTransitionEngine::initialState(const ToolkitTemplate &toolkitTemplate,
                                             const std::string &toolkitId,
                                             const std::string &name,
                                             const QDateTime &createdAt)
{
    Toolkit toolkit;
    toolkit.toolkitId = toolkitId;
    toolkit.templateId = toolkitTemplate.templateId;
    toolkit.name = name.empty() ? toolkitTemplate.name : name;
    toolkit.description = toolkitTemplate.description;
    toolkit.status = ToolkitStatus::NeverChecked;
    toolkit.createdAt = createdAt;
    toolkit.updatedAt = createdAt;
    toolkit.toolStates.reserve(toolkitTemplate.tools.size());
    for (const ToolDefinition &tool : toolkitTemplate.tools) {
        ToolState state;
        state.toolId = tool.toolId;
        state.name = tool.name;
        toolkit.toolStates.push_back(state);
    }
    return toolkit;
}

ToolkitStatus StatusTransitionEngine::statusFor(const std::vector<SlotVerdict> &verdicts)
{
    const bool allPresent = std::all_of(verdicts.begin(), verdicts.end(), [](const SlotVerdict &v) {
        return v.status == SlotStatus::Present;
    });
    return allPresent ? ToolkitStatus::CheckedIn : ToolkitStatus::Incomplete;
}

StatusTransitionEngine::CheckInResult StatusTransitionEngine::checkIn(const Toolkit &toolkit,
                                                                      const std::vector<SlotVerdict> &verdicts,
                                                                      const RegistrationInfo &registration,
                                                                      const QDateTime &timestamp,
                                                                      const std::string &checkinId,
                                                                      const std::string &note,
                                                                      const std::string &actor) const
{
    CheckInResult result;
    CheckInRecord &record = result.record;
    record.checkinId = checkinId;
    record.toolkitId = toolkit.toolkitId;
    record.templateId = toolkit.templateId;
    record.timestamp = timestamp;
    record.status = statusFor(verdicts);
    record.verdicts = verdicts;
    record.summary = summarize(verdicts);
    record.registration = registration;
    record.note = note;
    record.actor = actor;

    result.toolkit = applyRecord(toolkit, record);

    Logger::info(QStringLiteral("Toolkit %1: %2 -> %3 (%4/%5 present)")
                     .arg(QString::fromStdString(toolkit.toolkitId),
                          QString::fromStdString(toString(toolkit.status)),
                          QString::fromStdString(toString(record.status)))
                     .arg(record.summary.present)
                     .arg(record.summary.total));
    return result;
}

StatusTransitionEngine::CheckoutResult StatusTransitionEngine::checkout(const Toolkit &toolkit,
                                                                        const QDateTime &timestamp,
                                                                        const std::optional<std::string> &location) const
{
    CheckoutResult result;
    result.toolkit = toolkit;

    switch (toolkit.status) {
    case ToolkitStatus::NeverChecked:
        result.reason = "Toolkit has never been checked in";
        break;
    case ToolkitStatus::CheckedOut:
        result.reason = "Toolkit is already checked out";
        break;
    case ToolkitStatus::Incomplete:
        Logger::warning(QStringLiteral("Toolkit %1 checked out while incomplete")
                            .arg(QString::fromStdString(toolkit.toolkitId)));
        result.accepted = true;
        break;
    case ToolkitStatus::CheckedIn:
        result.accepted = true;
        break;
    }

    if (!result.accepted) {
        Logger::warning(QStringLiteral("Checkout of %1 rejected: %2")
                            .arg(QString::fromStdString(toolkit.toolkitId), QString::fromStdString(result.reason)));
        return result;
    }

    result.toolkit.status = ToolkitStatus::CheckedOut;
    result.toolkit.lastCheckOut = timestamp;
    result.toolkit.updatedAt = timestamp;
    if (location) {
        result.toolkit.location = *location;
    }
    Logger::info(QStringLiteral("Toolkit %1 checked out").arg(QString::fromStdString(toolkit.toolkitId)));
    return result;
}

Toolkit StatusTransitionEngine::applyRecord(const Toolkit &toolkit, const CheckInRecord &record)
{
    Toolkit next = toolkit;
    next.status = record.status;
    next.lastCheckIn = record.timestamp;
    next.updatedAt = record.timestamp;

    std::vector<ToolState> states;
    states.reserve(record.verdicts.size());
    for (const SlotVerdict &verdict : record.verdicts) {
        ToolState state;
        state.toolId = verdict.toolId;
        state.name = verdict.name;
        state.status = verdict.status;
        state.confidence = verdict.confidence;

        const auto previous = std::find_if(toolkit.toolStates.begin(), toolkit.toolStates.end(),
                                           [&verdict](const ToolState &s) { return s.toolId == verdict.toolId; });
        if (previous != toolkit.toolStates.end()) {
            state.lastSeen = previous->lastSeen;
        }
        if (verdict.status == SlotStatus::Present) {
            state.lastSeen = record.timestamp;
        }
        states.push_back(state);
    }
    next.toolStates = std::move(states);
    return next;
}

Toolkit StatusTransitionEngine::replay(const Toolkit &initial, const std::vector<CheckInRecord> &history)
{
    Toolkit toolkit = initial;
    for (const CheckInRecord &record : history) {
        toolkit = applyRecord(toolkit, record);
    }
    return toolkit;
}

std::string StatusTransitionEngine::makeCheckInId(const std::string &toolkitId, const QDateTime &timestamp)
{
    const QString stamp = timestamp.toUTC().toString(QStringLiteral("yyyyMMdd_hhmmsszzz"));
    return "ci_" + toolkitId + "_" + stamp.toStdString();
}

} // namespace kitcheck
