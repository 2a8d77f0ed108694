#include <QtTest>

#include "Logger.h"
#include "StatusTransitionEngine.h"

using namespace kitcheck;

namespace {

ToolkitTemplate makeTemplate()
{
    ToolkitTemplate tpl;
    tpl.templateId = "mka";
    tpl.name = "Maintenance Kit A";
    for (int i = 1; i <= 3; ++i) {
        ToolDefinition tool;
        tool.toolId = "tool_" + std::to_string(i);
        tool.name = "Tool " + std::to_string(i);
        tool.slotIndex = i;
        tool.region = RectRegion {i * 100, 0, 80, 80};
        tpl.tools.push_back(tool);
    }
    return tpl;
}

std::vector<SlotVerdict> verdicts(std::initializer_list<SlotStatus> statuses)
{
    std::vector<SlotVerdict> out;
    int i = 0;
    for (SlotStatus status : statuses) {
        ++i;
        SlotVerdict verdict;
        verdict.toolId = "tool_" + std::to_string(i);
        verdict.name = "Tool " + std::to_string(i);
        verdict.slotIndex = i;
        verdict.status = status;
        verdict.confidence = status == SlotStatus::Present ? 0.9 : (status == SlotStatus::Missing ? 0.1 : 0.5);
        out.push_back(verdict);
    }
    return out;
}

QDateTime at(const char *iso)
{
    return QDateTime::fromString(QString::fromLatin1(iso), Qt::ISODateWithMs);
}

} // namespace

class StatusTransitionTest : public QObject {
    Q_OBJECT

private:
    StatusTransitionEngine m_engine;

    Toolkit toolkitIn(ToolkitStatus status) const
    {
        Toolkit toolkit = StatusTransitionEngine::initialState(makeTemplate(), "MKA-001", "Unit 1");
        toolkit.status = status;
        return toolkit;
    }

private Q_SLOTS:
    void initialStateIsNeverChecked()
    {
        const Toolkit toolkit = StatusTransitionEngine::initialState(makeTemplate(), "MKA-001", "Unit 1");
        QCOMPARE(toolkit.status, ToolkitStatus::NeverChecked);
        QCOMPARE(toolkit.templateId, std::string("mka"));
        QCOMPARE(toolkit.name, std::string("Unit 1"));
        QCOMPARE(static_cast<int>(toolkit.toolStates.size()), 3);
        for (const ToolState &state : toolkit.toolStates) {
            QVERIFY(!state.status.has_value());
            QVERIFY(!state.lastSeen.isValid());
        }
    }

    void allPresentChecksIn_data()
    {
        QTest::addColumn<int>("prior");
        QTest::newRow("never_checked") << static_cast<int>(ToolkitStatus::NeverChecked);
        QTest::newRow("checked_in") << static_cast<int>(ToolkitStatus::CheckedIn);
        QTest::newRow("checked_out") << static_cast<int>(ToolkitStatus::CheckedOut);
        QTest::newRow("incomplete") << static_cast<int>(ToolkitStatus::Incomplete);
    }

    void allPresentChecksIn()
    {
        QFETCH(int, prior);
        const Toolkit before = toolkitIn(static_cast<ToolkitStatus>(prior));
        const QDateTime now = at("2024-03-05T14:07:09.042Z");

        const auto result = m_engine.checkIn(before, verdicts({SlotStatus::Present, SlotStatus::Present,
                                                               SlotStatus::Present}),
                                             RegistrationInfo(), now, "ci_1", "all good", "alex");
        QCOMPARE(result.record.status, ToolkitStatus::CheckedIn);
        QCOMPARE(result.toolkit.status, ToolkitStatus::CheckedIn);
        QCOMPARE(result.toolkit.lastCheckIn, now);
        QCOMPARE(result.record.summary.present, 3);
        QCOMPARE(result.record.summary.total, 3);
        QCOMPARE(result.record.note, std::string("all good"));
        QCOMPARE(result.record.actor, std::string("alex"));
        for (const ToolState &state : result.toolkit.toolStates) {
            QCOMPARE(state.status.value_or(SlotStatus::Missing), SlotStatus::Present);
            QCOMPARE(state.lastSeen, now);
        }
    }

    void anyMissingOrUncertainIsIncomplete_data()
    {
        QTest::addColumn<int>("second");
        QTest::addColumn<int>("third");
        QTest::newRow("one missing") << static_cast<int>(SlotStatus::Missing) << static_cast<int>(SlotStatus::Present);
        QTest::newRow("one uncertain") << static_cast<int>(SlotStatus::Present) << static_cast<int>(SlotStatus::Uncertain);
        QTest::newRow("mixed") << static_cast<int>(SlotStatus::Missing) << static_cast<int>(SlotStatus::Uncertain);
    }

    void anyMissingOrUncertainIsIncomplete()
    {
        QFETCH(int, second);
        QFETCH(int, third);
        const auto slotVerdicts = verdicts({SlotStatus::Present, static_cast<SlotStatus>(second), static_cast<SlotStatus>(third)});

        for (ToolkitStatus prior : {ToolkitStatus::NeverChecked, ToolkitStatus::CheckedIn, ToolkitStatus::CheckedOut,
                                    ToolkitStatus::Incomplete}) {
            const auto result = m_engine.checkIn(toolkitIn(prior), slotVerdicts, RegistrationInfo(),
                                                 QDateTime::currentDateTimeUtc(), "ci_x");
            QCOMPARE(result.toolkit.status, ToolkitStatus::Incomplete);
            const CheckInSummary &summary = result.record.summary;
            QCOMPARE(summary.present + summary.missing + summary.uncertain, summary.total);
            QCOMPARE(summary.total, 3);
            QVERIFY(!summary.isComplete());
        }
    }

    void emptyVerdictListChecksIn()
    {
        const auto result = m_engine.checkIn(toolkitIn(ToolkitStatus::NeverChecked), {}, RegistrationInfo(),
                                             QDateTime::currentDateTimeUtc(), "ci_empty");
        QCOMPARE(result.toolkit.status, ToolkitStatus::CheckedIn);
        QCOMPARE(result.record.summary.total, 0);
    }

    void checkoutRejectedBeforeFirstCheckIn()
    {
        const Toolkit before = toolkitIn(ToolkitStatus::NeverChecked);
        const auto result = m_engine.checkout(before, QDateTime::currentDateTimeUtc(), std::string("Hangar 2"));
        QVERIFY(!result.accepted);
        QVERIFY(!result.reason.empty());
        QCOMPARE(result.toolkit.status, ToolkitStatus::NeverChecked);
        QVERIFY(result.toolkit.location.empty());
        QVERIFY(!result.toolkit.lastCheckOut.isValid());
    }

    void checkoutRejectedWhenAlreadyOut()
    {
        const auto result = m_engine.checkout(toolkitIn(ToolkitStatus::CheckedOut), QDateTime::currentDateTimeUtc());
        QVERIFY(!result.accepted);
        QCOMPARE(result.toolkit.status, ToolkitStatus::CheckedOut);
    }

    void incompleteCheckoutIsLoggedAsWarning()
    {
        QStringList warnings;
        Logger::setSink([&warnings](QtMsgType type, const QString &text) {
            if (type == QtWarningMsg) {
                warnings << text;
            }
        });
        const auto result = m_engine.checkout(toolkitIn(ToolkitStatus::Incomplete), QDateTime::currentDateTimeUtc());
        Logger::setSink(nullptr);

        QVERIFY(result.accepted);
        QCOMPARE(static_cast<int>(warnings.size()), 1);
        QVERIFY(warnings.constFirst().contains(QStringLiteral("MKA-001")));
        QVERIFY(warnings.constFirst().contains(QStringLiteral("[WARNING]")));
    }

    void checkoutKeepsSnapshot()
    {
        const QDateTime checkedIn = at("2024-03-05T08:00:00.000Z");
        const QDateTime checkedOut = at("2024-03-05T09:30:00.000Z");
        const auto in = m_engine.checkIn(toolkitIn(ToolkitStatus::NeverChecked),
                                         verdicts({SlotStatus::Present, SlotStatus::Missing, SlotStatus::Present}),
                                         RegistrationInfo(), checkedIn, "ci_1");
        QCOMPARE(in.toolkit.status, ToolkitStatus::Incomplete);

        const auto out = m_engine.checkout(in.toolkit, checkedOut, std::string("Line 4"));
        QVERIFY(out.accepted);
        QCOMPARE(out.toolkit.status, ToolkitStatus::CheckedOut);
        QCOMPARE(out.toolkit.location, std::string("Line 4"));
        QCOMPARE(out.toolkit.lastCheckOut, checkedOut);
        QCOMPARE(out.toolkit.lastCheckIn, checkedIn);
        QCOMPARE(out.toolkit.toolStates.size(), in.toolkit.toolStates.size());
        for (size_t i = 0; i < out.toolkit.toolStates.size(); ++i) {
            QVERIFY(out.toolkit.toolStates[i].status == in.toolkit.toolStates[i].status);
        }

        const auto plain = m_engine.checkout(toolkitIn(ToolkitStatus::CheckedIn), checkedOut);
        QVERIFY(plain.accepted);
        QVERIFY(plain.toolkit.location.empty());
    }

    void lastSeenSurvivesMissingCheckIn()
    {
        const QDateTime first = at("2024-03-01T10:00:00.000Z");
        const QDateTime second = at("2024-03-02T10:00:00.000Z");
        const auto a = m_engine.checkIn(toolkitIn(ToolkitStatus::NeverChecked),
                                        verdicts({SlotStatus::Present, SlotStatus::Present, SlotStatus::Present}),
                                        RegistrationInfo(), first, "ci_a");
        const auto b = m_engine.checkIn(a.toolkit,
                                        verdicts({SlotStatus::Present, SlotStatus::Missing, SlotStatus::Uncertain}),
                                        RegistrationInfo(), second, "ci_b");
        QCOMPARE(b.toolkit.toolStates[0].lastSeen, second);
        QCOMPARE(b.toolkit.toolStates[1].lastSeen, first);
        QCOMPARE(b.toolkit.toolStates[2].lastSeen, first);
        QCOMPARE(b.toolkit.toolStates[1].status.value_or(SlotStatus::Present), SlotStatus::Missing);
    }

    void replayMatchesSequentialCheckIns()
    {
        const Toolkit initial = toolkitIn(ToolkitStatus::NeverChecked);
        const auto a = m_engine.checkIn(initial, verdicts({SlotStatus::Present, SlotStatus::Present, SlotStatus::Present}),
                                        RegistrationInfo(), at("2024-03-01T10:00:00.000Z"), "ci_a");
        const auto b = m_engine.checkIn(a.toolkit,
                                        verdicts({SlotStatus::Missing, SlotStatus::Present, SlotStatus::Present}),
                                        RegistrationInfo(), at("2024-03-02T10:00:00.000Z"), "ci_b");

        const Toolkit replayed = StatusTransitionEngine::replay(initial, {a.record, b.record});
        QCOMPARE(replayed.status, b.toolkit.status);
        QCOMPARE(replayed.lastCheckIn, b.toolkit.lastCheckIn);
        QCOMPARE(replayed.toolStates.size(), b.toolkit.toolStates.size());
        for (size_t i = 0; i < replayed.toolStates.size(); ++i) {
            QVERIFY(replayed.toolStates[i].status == b.toolkit.toolStates[i].status);
            QCOMPARE(replayed.toolStates[i].lastSeen, b.toolkit.toolStates[i].lastSeen);
        }

        QCOMPARE(StatusTransitionEngine::replay(initial, {}).status, ToolkitStatus::NeverChecked);
    }

    void checkInIdEncodesToolkitAndTime()
    {
        QCOMPARE(StatusTransitionEngine::makeCheckInId("MKA-001", at("2024-03-05T14:07:09.042Z")),
                 std::string("ci_MKA-001_20240305_140709042"));
    }

    void statusStringsRoundTrip()
    {
        QCOMPARE(toString(ToolkitStatus::NeverChecked), std::string("never_checked"));
        QCOMPARE(toolkitStatusFromString("checked_out"), ToolkitStatus::CheckedOut);
        QCOMPARE(toolkitStatusFromString("bogus"), ToolkitStatus::NeverChecked);
        QVERIFY(!slotStatusFromString("unknown").has_value());
        QCOMPARE(slotStatusFromString("missing").value_or(SlotStatus::Present), SlotStatus::Missing);
    }
};

QTEST_GUILESS_MAIN(StatusTransitionTest)
#include "tst_status_transition.moc"
