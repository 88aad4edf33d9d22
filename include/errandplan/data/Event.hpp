#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

#include "errandplan/data/Errand.hpp"

namespace errandplan {
namespace data {

struct CalendarEvent
{
    QUuid id = QUuid::createUuid();
    QString title;
    QDateTime start;
    QDateTime end;
    QString location;
    std::optional<GeoPoint> coordinate;
    // Unlocated events flagged ignorable do not block free time.
    bool ignorable = false;

    bool hasResolvableLocation() const { return coordinate.has_value(); }
};

struct PlanningHorizon
{
    QDate first;
    QDate last;

    bool isValid() const { return first.isValid() && last.isValid() && first <= last; }
    bool contains(const QDate &date) const { return date >= first && date <= last; }
    int days() const { return isValid() ? static_cast<int>(first.daysTo(last)) + 1 : 0; }
};

} // namespace data
} // namespace errandplan
