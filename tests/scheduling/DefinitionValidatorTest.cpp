#include <QtTest/QtTest>

#include <limits>

#include "errandplan/scheduling/DefinitionValidator.hpp"

using namespace errandplan::data;
using errandplan::scheduling::validateDefinition;

namespace {
ErrandDefinition validErrand()
{
    ErrandDefinition definition;
    definition.title = "Return library books";
    definition.location = NamedPlace{QStringLiteral("City library"), std::nullopt};
    definition.durationMinutes = 20;
    definition.window = TimeWindow{10 * 60, 18 * 60};
    return definition;
}
} // namespace

class DefinitionValidatorTest : public QObject
{
    Q_OBJECT

private slots:
    void acceptsWellFormedDefinition();
    void rejectsMissingTitle();
    void rejectsBadLocations();
    void windowBounds_data();
    void windowBounds();
    void rejectsBadDurations();
    void rejectsSelfConflict();
};

void DefinitionValidatorTest::acceptsWellFormedDefinition()
{
    QString error;
    QVERIFY(validateDefinition(validErrand(), &error));
    QVERIFY(error.isEmpty());

    auto flexible = validErrand();
    flexible.window = TimeWindow{10 * 60, 11 * 60};
    flexible.durationMinutes = 90;
    flexible.minimumDurationMinutes = 45;
    QVERIFY(validateDefinition(flexible));
}

void DefinitionValidatorTest::rejectsMissingTitle()
{
    auto definition = validErrand();
    definition.title = "   ";
    QString error;
    QVERIFY(!validateDefinition(definition, &error));
    QCOMPARE(error, QStringLiteral("Title is required"));
}

void DefinitionValidatorTest::rejectsBadLocations()
{
    auto unnamed = validErrand();
    unnamed.location = NamedPlace{};
    QVERIFY(!validateDefinition(unnamed));

    auto offMap = validErrand();
    offMap.location = ExactLocation{GeoPoint{91.0, 0.0}, QStringLiteral("North of the pole")};
    QVERIFY(!validateDefinition(offMap));

    auto notANumber = validErrand();
    notANumber.location = ExactLocation{GeoPoint{std::numeric_limits<double>::quiet_NaN(), 0.0}, QString()};
    QVERIFY(!validateDefinition(notANumber));

    auto emptyCategory = validErrand();
    emptyCategory.location = StoreCategory{};
    QVERIFY(!validateDefinition(emptyCategory));

    auto remote = validErrand();
    remote.location = RemoteLocation{};
    QVERIFY(validateDefinition(remote));
}

void DefinitionValidatorTest::windowBounds_data()
{
    QTest::addColumn<int>("startMinute");
    QTest::addColumn<int>("endMinute");
    QTest::addColumn<bool>("valid");

    QTest::newRow("office hours") << 9 * 60 << 17 * 60 << true;
    QTest::newRow("whole day") << 0 << 24 * 60 << true;
    QTest::newRow("inverted") << 18 * 60 << 10 * 60 << false;
    QTest::newRow("empty") << 12 * 60 << 12 * 60 << false;
    QTest::newRow("past midnight") << 20 * 60 << 25 * 60 << false;
    QTest::newRow("negative start") << -30 << 10 * 60 << false;
    QTest::newRow("shorter than errand") << 9 * 60 << 9 * 60 + 10 << false;
}

void DefinitionValidatorTest::windowBounds()
{
    QFETCH(int, startMinute);
    QFETCH(int, endMinute);
    QFETCH(bool, valid);

    auto definition = validErrand();
    definition.window = TimeWindow{startMinute, endMinute};
    QCOMPARE(validateDefinition(definition), valid);
}

void DefinitionValidatorTest::rejectsBadDurations()
{
    auto zero = validErrand();
    zero.durationMinutes = 0;
    QVERIFY(!validateDefinition(zero));

    auto tooLong = validErrand();
    tooLong.window = TimeWindow{10 * 60, 11 * 60};
    tooLong.durationMinutes = 90;
    QVERIFY(!validateDefinition(tooLong));

    auto minimumAboveEstimate = validErrand();
    minimumAboveEstimate.minimumDurationMinutes = 30;
    QVERIFY(!validateDefinition(minimumAboveEstimate));

    auto negativeMinimum = validErrand();
    negativeMinimum.minimumDurationMinutes = -5;
    QVERIFY(!validateDefinition(negativeMinimum));
}

void DefinitionValidatorTest::rejectsSelfConflict()
{
    auto definition = validErrand();
    definition.conflictsWith = {definition.id};
    QString error;
    QVERIFY(!validateDefinition(definition, &error));
    QVERIFY(!error.isEmpty());
}

QTEST_GUILESS_MAIN(DefinitionValidatorTest)
#include "DefinitionValidatorTest.moc"
