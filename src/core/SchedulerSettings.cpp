#include "errandplan/core/SchedulerSettings.hpp"

#include "errandplan/core/Logging.hpp"

#include <QSettings>

namespace errandplan {
namespace core {

namespace {
const auto GroupName = QStringLiteral("scheduler");

int readInt(QSettings &settings, const QString &key, int fallback, int minimum, int maximum)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value < minimum || value > maximum) {
        qCWarning(lcPlanner) << "Ignoring invalid setting" << key << settings.value(key)
                             << "- using" << fallback;
        return fallback;
    }
    return value;
}

double readDouble(QSettings &settings, const QString &key, double fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok) {
        qCWarning(lcPlanner) << "Ignoring invalid setting" << key << settings.value(key);
        return fallback;
    }
    return value;
}
} // namespace

SchedulerSettings SchedulerSettings::load(QSettings &settings)
{
    const SchedulerSettings defaults;
    SchedulerSettings result;

    settings.beginGroup(GroupName);
    result.cascadeDepth = readInt(settings, QStringLiteral("cascadeDepth"), defaults.cascadeDepth, 0, 8);
    result.maxCandidateIntervals = readInt(settings, QStringLiteral("maxCandidateIntervals"),
                                           defaults.maxCandidateIntervals, 1, 10000);
    result.maxCandidateLocations = readInt(settings, QStringLiteral("maxCandidateLocations"),
                                           defaults.maxCandidateLocations, 1, 100);
    result.providerRetries = readInt(settings, QStringLiteral("providerRetries"), defaults.providerRetries, 0, 10);
    result.providerBackoffMs = readInt(settings, QStringLiteral("providerBackoffMs"),
                                       defaults.providerBackoffMs, 0, 10000);
    result.transferPenaltyMinutes = readInt(settings, QStringLiteral("transferPenaltyMinutes"),
                                            defaults.transferPenaltyMinutes, 0, 240);
    result.unknownOriginBufferMinutes = readInt(settings, QStringLiteral("unknownOriginBufferMinutes"),
                                                defaults.unknownOriginBufferMinutes, 0, 240);
    result.dayStartMinute = readInt(settings, QStringLiteral("dayStartMinute"), defaults.dayStartMinute, 0, 24 * 60);
    result.dayEndMinute = readInt(settings, QStringLiteral("dayEndMinute"), defaults.dayEndMinute, 0, 24 * 60);
    if (result.dayEndMinute <= result.dayStartMinute) {
        qCWarning(lcPlanner) << "Waking hours" << result.dayStartMinute << result.dayEndMinute
                             << "are inverted - using defaults";
        result.dayStartMinute = defaults.dayStartMinute;
        result.dayEndMinute = defaults.dayEndMinute;
    }
    result.concurrentQueries = settings.value(QStringLiteral("concurrentQueries"), defaults.concurrentQueries).toBool();
    result.home.latitude = readDouble(settings, QStringLiteral("homeLatitude"), defaults.home.latitude);
    result.home.longitude = readDouble(settings, QStringLiteral("homeLongitude"), defaults.home.longitude);
    settings.endGroup();

    return result;
}

void SchedulerSettings::save(QSettings &settings) const
{
    settings.beginGroup(GroupName);
    settings.setValue(QStringLiteral("cascadeDepth"), cascadeDepth);
    settings.setValue(QStringLiteral("maxCandidateIntervals"), maxCandidateIntervals);
    settings.setValue(QStringLiteral("maxCandidateLocations"), maxCandidateLocations);
    settings.setValue(QStringLiteral("providerRetries"), providerRetries);
    settings.setValue(QStringLiteral("providerBackoffMs"), providerBackoffMs);
    settings.setValue(QStringLiteral("transferPenaltyMinutes"), transferPenaltyMinutes);
    settings.setValue(QStringLiteral("unknownOriginBufferMinutes"), unknownOriginBufferMinutes);
    settings.setValue(QStringLiteral("dayStartMinute"), dayStartMinute);
    settings.setValue(QStringLiteral("dayEndMinute"), dayEndMinute);
    settings.setValue(QStringLiteral("concurrentQueries"), concurrentQueries);
    settings.setValue(QStringLiteral("homeLatitude"), home.latitude);
    settings.setValue(QStringLiteral("homeLongitude"), home.longitude);
    settings.endGroup();
}

} // namespace core
} // namespace errandplan
