#pragma once

#include <QDateTime>
#include <QUuid>
#include <optional>
#include <vector>

#include "errandplan/data/ErrandInstance.hpp"
#include "errandplan/data/Event.hpp"

namespace errandplan {
namespace scheduling {

class ScheduleState;

struct FreeInterval
{
    QDateTime start;
    QDateTime end;
    // Where the user is when the interval begins. After an event without a
    // location this is home and originKnown is false.
    data::GeoPoint origin;
    bool originKnown = true;
    // Location of the next commitment on the same day, if any.
    std::optional<data::GeoPoint> next;
    // How the next committed errand is reached; unset for calendar events.
    std::optional<data::AccessType> nextAccess;

    int minutes() const { return static_cast<int>(start.secsTo(end) / 60); }
    bool operator==(const FreeInterval &other) const;
};

struct LocationContext
{
    data::GeoPoint location;
    bool known = true;
    // When the user got there: the end of that block, or the start of the day.
    QDateTime since;
};

// Derived view of the free time left by calendar events and committed
// instances. Free intervals never cross day boundaries and never leave the
// configured waking hours.
class FreeTimeLedger
{
public:
    FreeTimeLedger();
    FreeTimeLedger(const data::PlanningHorizon &horizon, int dayStartMinute, int dayEndMinute,
                   const data::GeoPoint &home, const std::vector<data::CalendarEvent> &events);

    const std::vector<FreeInterval> &intervals() const;
    std::vector<FreeInterval> intervalsWithin(const QDateTime &from, const QDateTime &to) const;

    bool reserve(const QDateTime &start, const QDateTime &end, const data::ErrandInstance &instance);
    bool release(const QUuid &instanceId);
    bool contains(const QUuid &instanceId) const;
    bool isFree(const QDateTime &start, const QDateTime &end) const;

    // Where the user is at `time`, considering located blocks that ended
    // on the same day.
    LocationContext locationAt(const QDateTime &time) const;

    const data::GeoPoint &home() const;
    const data::PlanningHorizon &horizon() const;

    bool operator==(const FreeTimeLedger &other) const;
    bool operator!=(const FreeTimeLedger &other) const { return !(*this == other); }

private:
    enum class BlockKind
    {
        Located,
        Opaque,
        PassThrough,
    };

    struct Block
    {
        QDateTime start;
        QDateTime end;
        BlockKind kind = BlockKind::Opaque;
        data::GeoPoint location;
        std::optional<data::AccessType> access;
        QUuid owner;

        bool operator==(const Block &other) const;
    };

    void rebuild();
    // Whether the block decides the user's location, given the latest end
    // of the blocks that did so before it.
    static bool movesUser(const Block &block, const QDateTime &latestEnd);
    std::vector<const Block *> blocksOn(const QDate &day) const;
    QDateTime dayStart(const QDate &day) const;
    QDateTime dayEnd(const QDate &day) const;

    data::PlanningHorizon m_horizon;
    int m_dayStartMinute = 0;
    int m_dayEndMinute = 24 * 60;
    data::GeoPoint m_home;
    std::vector<Block> m_calendarBlocks;
    std::vector<Block> m_reservations;
    std::vector<FreeInterval> m_intervals;
};

} // namespace scheduling
} // namespace errandplan
