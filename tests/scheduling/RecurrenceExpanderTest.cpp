#include <QtTest/QtTest>

#include "errandplan/scheduling/RecurrenceExpander.hpp"

using namespace errandplan::data;
using errandplan::scheduling::Occurrence;
using errandplan::scheduling::RecurrenceCursor;
using errandplan::scheduling::RecurrenceExpander;

namespace {

const QDate Monday(2026, 10, 19);

ErrandDefinition repeating(RepeatKind kind, int every = 1)
{
    ErrandDefinition definition;
    definition.title = "Repeat";
    definition.durationMinutes = 30;
    definition.repetition.kind = kind;
    definition.repetition.every = every;
    return definition;
}

QList<QDate> drain(RecurrenceCursor &cursor)
{
    QList<QDate> dates;
    while (const auto occurrence = cursor.next()) {
        dates.append(occurrence->target);
        cursor.confirm(occurrence->target);
    }
    return dates;
}

} // namespace

class RecurrenceExpanderTest : public QObject
{
    Q_OBJECT

private slots:
    void dailyCoversHorizon();
    void weeklyOnDays();
    void monthlyClampsToShortMonths();
    void spacingWaitsForConfirmation();
    void spacedOnDaysStayOnAllowedDays();
    void toleranceIsClippedToHorizon();
    void singleDateOutsideHorizon();
    void undatedErrandSpansHorizon();
    void rejectsInconsistentRules();
    void rejectsGapLongerThanHorizon();
};

void RecurrenceExpanderTest::dailyCoversHorizon()
{
    const auto definition = repeating(RepeatKind::Daily);
    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(2)});
    QVERIFY(cursor.has_value());
    QVERIFY(!cursor->isSpacingDriven());

    const auto dates = drain(*cursor);
    QCOMPARE(dates, (QList<QDate>{Monday, Monday.addDays(1), Monday.addDays(2)}));
    QVERIFY(cursor->isExhausted());
}

void RecurrenceExpanderTest::weeklyOnDays()
{
    auto definition = repeating(RepeatKind::WeeklyOnDays, 2);
    definition.repetition.allowedDays = {1, 3};
    definition.repetition.anchor = Monday;

    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(20)});
    QVERIFY(cursor.has_value());

    // Every other week, on Monday and Wednesday.
    const auto dates = drain(*cursor);
    QCOMPARE(dates, (QList<QDate>{Monday, Monday.addDays(2), Monday.addDays(14), Monday.addDays(16)}));
}

void RecurrenceExpanderTest::monthlyClampsToShortMonths()
{
    auto definition = repeating(RepeatKind::Monthly);
    definition.repetition.anchor = QDate(2026, 1, 31);

    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{QDate(2026, 2, 1), QDate(2026, 3, 31)});
    QVERIFY(cursor.has_value());
    QCOMPARE(drain(*cursor), (QList<QDate>{QDate(2026, 2, 28), QDate(2026, 3, 31)}));
}

void RecurrenceExpanderTest::spacingWaitsForConfirmation()
{
    auto definition = repeating(RepeatKind::EveryNDays, 2);
    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(6)});
    QVERIFY(cursor.has_value());
    QVERIFY(cursor->isSpacingDriven());

    const auto first = cursor->next();
    QVERIFY(first.has_value());
    QCOMPARE(first->target, Monday);
    QVERIFY(!cursor->next().has_value());

    // The errand actually happened a day late; spacing restarts from there.
    cursor->confirm(Monday.addDays(1));
    const auto second = cursor->next();
    QVERIFY(second.has_value());
    QCOMPARE(second->target, Monday.addDays(3));
}

void RecurrenceExpanderTest::spacedOnDaysStayOnAllowedDays()
{
    auto definition = repeating(RepeatKind::WeeklyOnDays);
    definition.repetition.allowedDays = {1, 4};
    definition.interval.targetDays = 3;

    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(13)});
    QVERIFY(cursor.has_value());
    QVERIFY(cursor->isSpacingDriven());

    // Thursday plus three days is a Sunday; the next allowed day is Monday.
    const auto dates = drain(*cursor);
    QCOMPARE(dates, (QList<QDate>{Monday, Monday.addDays(3), Monday.addDays(7), Monday.addDays(10)}));
    for (const auto &date : dates) {
        QVERIFY(date.dayOfWeek() == 1 || date.dayOfWeek() == 4);
    }
}

void RecurrenceExpanderTest::toleranceIsClippedToHorizon()
{
    auto definition = repeating(RepeatKind::Monthly);
    definition.repetition.anchor = Monday;
    definition.interval.toleranceDays = 3;

    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(2)});
    QVERIFY(cursor.has_value());
    const auto occurrence = cursor->next();
    QVERIFY(occurrence.has_value());
    QCOMPARE(occurrence->target, Monday);
    QCOMPARE(occurrence->earliest, Monday);
    QCOMPARE(occurrence->latest, Monday.addDays(2));
    QVERIFY(!cursor->next().has_value());
}

void RecurrenceExpanderTest::singleDateOutsideHorizon()
{
    auto definition = repeating(RepeatKind::None);
    definition.date = Monday.addDays(10);

    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(2)});
    QVERIFY(cursor.has_value());
    QVERIFY(!cursor->next().has_value());
}

void RecurrenceExpanderTest::undatedErrandSpansHorizon()
{
    const auto definition = repeating(RepeatKind::None);
    RecurrenceExpander expander;
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(4)});
    QVERIFY(cursor.has_value());

    const auto occurrence = cursor->next();
    QVERIFY(occurrence.has_value());
    QCOMPARE(occurrence->earliest, Monday);
    QCOMPARE(occurrence->latest, Monday.addDays(4));
    QVERIFY(!cursor->next().has_value());
}

void RecurrenceExpanderTest::rejectsInconsistentRules()
{
    RecurrenceExpander expander;
    const PlanningHorizon horizon{Monday, Monday.addDays(6)};
    QString error;

    auto zeroMultiplier = repeating(RepeatKind::Weekly, 0);
    QVERIFY(!expander.expand(zeroMultiplier, horizon, &error).has_value());
    QVERIFY(!error.isEmpty());

    auto noDays = repeating(RepeatKind::WeeklyOnDays);
    QVERIFY(!RecurrenceExpander::validateRule(noDays));

    auto badDay = repeating(RepeatKind::WeeklyOnDays);
    badDay.repetition.allowedDays = {0};
    QVERIFY(!RecurrenceExpander::validateRule(badDay));

    auto wideTolerance = repeating(RepeatKind::Daily);
    wideTolerance.interval.targetDays = 2;
    wideTolerance.interval.toleranceDays = 2;
    error.clear();
    QVERIFY(!RecurrenceExpander::validateRule(wideTolerance, &error));
    QVERIFY(error.contains(QStringLiteral("Tolerance")));

    // A daily errand can never be two days apart from its predecessor.
    auto impossibleGap = repeating(RepeatKind::Daily);
    impossibleGap.window = TimeWindow{9 * 60, 10 * 60};
    impossibleGap.interval.minimumGapMinutes = 2 * 24 * 60;
    QVERIFY(!RecurrenceExpander::validateRule(impossibleGap));

    auto fine = repeating(RepeatKind::EveryNDays, 3);
    fine.interval.minimumGapMinutes = 2 * 24 * 60;
    QVERIFY(RecurrenceExpander::validateRule(fine));
}

void RecurrenceExpanderTest::rejectsGapLongerThanHorizon()
{
    auto definition = repeating(RepeatKind::Daily);
    definition.interval.targetDays = 3;
    definition.interval.toleranceDays = 2;
    definition.interval.minimumGapMinutes = 5 * 24 * 60;
    QVERIFY(RecurrenceExpander::validateRule(definition));

    // The second occurrence may land on Tuesday, yet five days must pass.
    RecurrenceExpander expander;
    QString error;
    QVERIFY(!expander.expand(definition, PlanningHorizon{Monday, Monday.addDays(2)}, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("no slot")));

    // A single day only ever holds the first occurrence.
    auto cursor = expander.expand(definition, PlanningHorizon{Monday, Monday});
    QVERIFY(cursor.has_value());
    QCOMPARE(drain(*cursor), (QList<QDate>{Monday}));
}

QTEST_GUILESS_MAIN(RecurrenceExpanderTest)
#include "RecurrenceExpanderTest.moc"
