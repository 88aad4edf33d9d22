#pragma once

#include "errandplan/data/Errand.hpp"

class QSettings;

namespace errandplan {
namespace core {

struct SchedulerSettings
{
    int cascadeDepth = 2;
    int maxCandidateIntervals = 96;
    int maxCandidateLocations = 5;
    int providerRetries = 2;
    int providerBackoffMs = 100;
    int transferPenaltyMinutes = 5;
    // Stands in for travel out of an event whose location is unknown.
    int unknownOriginBufferMinutes = 30;
    int dayStartMinute = 7 * 60;
    int dayEndMinute = 22 * 60;
    bool concurrentQueries = true;
    data::GeoPoint home;

    static SchedulerSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace errandplan
