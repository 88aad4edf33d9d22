#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "errandplan/core/SchedulerSettings.hpp"

using errandplan::core::SchedulerSettings;

class SchedulerSettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void saveAndLoad();
    void rejectsOutOfRangeValues();
};

void SchedulerSettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

    const auto loaded = SchedulerSettings::load(settings);
    QCOMPARE(loaded.cascadeDepth, 2);
    QCOMPARE(loaded.dayStartMinute, 7 * 60);
    QCOMPARE(loaded.dayEndMinute, 22 * 60);
    QCOMPARE(loaded.providerRetries, 2);
    QCOMPARE(loaded.unknownOriginBufferMinutes, 30);
    QVERIFY(loaded.concurrentQueries);
}

void SchedulerSettingsTest::saveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.ini"));

    SchedulerSettings custom;
    custom.cascadeDepth = 3;
    custom.transferPenaltyMinutes = 12;
    custom.unknownOriginBufferMinutes = 45;
    custom.dayStartMinute = 6 * 60;
    custom.concurrentQueries = false;
    custom.home = errandplan::data::GeoPoint{47.07, 15.44};
    {
        QSettings settings(path, QSettings::IniFormat);
        custom.save(settings);
    }

    QSettings settings(path, QSettings::IniFormat);
    const auto loaded = SchedulerSettings::load(settings);
    QCOMPARE(loaded.cascadeDepth, 3);
    QCOMPARE(loaded.transferPenaltyMinutes, 12);
    QCOMPARE(loaded.unknownOriginBufferMinutes, 45);
    QCOMPARE(loaded.dayStartMinute, 6 * 60);
    QVERIFY(!loaded.concurrentQueries);
    QCOMPARE(loaded.home.latitude, 47.07);
    QCOMPARE(loaded.home.longitude, 15.44);
}

void SchedulerSettingsTest::rejectsOutOfRangeValues()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("broken.ini")), QSettings::IniFormat);
    settings.beginGroup(QStringLiteral("scheduler"));
    settings.setValue(QStringLiteral("cascadeDepth"), -1);
    settings.setValue(QStringLiteral("providerRetries"), QStringLiteral("often"));
    settings.setValue(QStringLiteral("dayStartMinute"), 20 * 60);
    settings.setValue(QStringLiteral("dayEndMinute"), 8 * 60);
    settings.endGroup();

    const auto loaded = SchedulerSettings::load(settings);
    QCOMPARE(loaded.cascadeDepth, 2);
    QCOMPARE(loaded.providerRetries, 2);
    QCOMPARE(loaded.dayStartMinute, 7 * 60);
    QCOMPARE(loaded.dayEndMinute, 22 * 60);
}

QTEST_GUILESS_MAIN(SchedulerSettingsTest)
#include "SchedulerSettingsTest.moc"
