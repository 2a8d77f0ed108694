#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDateTime>

#include "ToolkitState.h"
#include "ToolkitTemplate.h"

namespace kitcheck {

// Toolkit lifecycle. The toolkit is a view over its check-in history: every change goes through an
// immutable record first and the new toolkit state is derived from it.
class StatusTransitionEngine {
public:
    struct CheckInResult {
        CheckInRecord record;
        Toolkit toolkit;
    };

    struct CheckoutResult {
        bool accepted {false};
        std::string reason; // set when rejected
        Toolkit toolkit;
    };

    [[nodiscard]] static Toolkit initialState(const ToolkitTemplate &toolkitTemplate,
                                              const std::string &toolkitId,
                                              const std::string &name,
                                              const QDateTime &createdAt = QDateTime::currentDateTimeUtc());

    // Allowed from every state.
    [[nodiscard]] CheckInResult checkIn(const Toolkit &toolkit,
                                        const std::vector<SlotVerdict> &verdicts,
                                        const RegistrationInfo &registration,
                                        const QDateTime &timestamp,
                                        const std::string &checkinId,
                                        const std::string &note = {},
                                        const std::string &actor = {}) const;

    // Allowed from checked_in and incomplete only.
    [[nodiscard]] CheckoutResult checkout(const Toolkit &toolkit,
                                          const QDateTime &timestamp,
                                          const std::optional<std::string> &location = std::nullopt) const;

    [[nodiscard]] static Toolkit applyRecord(const Toolkit &toolkit, const CheckInRecord &record);

    // Rebuilds the toolkit from its records, oldest first.
    [[nodiscard]] static Toolkit replay(const Toolkit &initial, const std::vector<CheckInRecord> &history);

    [[nodiscard]] static ToolkitStatus statusFor(const std::vector<SlotVerdict> &verdicts);

    // ci_<toolkit>_<yyyyMMdd_hhmmsszzz>
    [[nodiscard]] static std::string makeCheckInId(const std::string &toolkitId, const QDateTime &timestamp);
};

} // namespace kitcheck
