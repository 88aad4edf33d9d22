#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

#include "errandplan/data/Errand.hpp"

namespace errandplan {
namespace data {

enum class InstanceStatus
{
    Unscheduled,
    TentativelyDisplacing,
    Placed,
    Unschedulable,
};

struct TravelSegment
{
    int durationMinutes = 0;
    AccessType access = AccessType::Drive;
    int transfers = 0;

    bool operator==(const TravelSegment &other) const
    {
        return durationMinutes == other.durationMinutes && access == other.access
            && transfers == other.transfers;
    }
};

struct ErrandInstance
{
    QUuid id;
    // Non-owning; the definition outlives every instance derived from it.
    const ErrandDefinition *definition = nullptr;
    QDate targetDate;
    QDate earliestDate;
    QDate latestDate;
    std::optional<GeoPoint> location;
    QString locationLabel;
    QDateTime start;
    QDateTime end;
    TravelSegment travelIn;
    InstanceStatus status = InstanceStatus::Unscheduled;
    bool pinned = false;

    QUuid definitionId() const;
    int priority() const;
    int durationMinutes() const;
};

// Stable across runs, so identical inputs produce identical instance ids.
QUuid instanceIdFor(const QUuid &definitionId, const QDate &date);

ErrandInstance makeInstance(const ErrandDefinition &definition, const QDate &targetDate,
                            const QDate &earliestDate, const QDate &latestDate);

} // namespace data
} // namespace errandplan
