#include "errandplan/scheduling/FreeTimeLedger.hpp"

#include "errandplan/core/Logging.hpp"

#include <algorithm>

namespace errandplan {
namespace scheduling {

bool FreeInterval::operator==(const FreeInterval &other) const
{
    return start == other.start && end == other.end && origin == other.origin
        && originKnown == other.originKnown && next == other.next && nextAccess == other.nextAccess;
}

bool FreeTimeLedger::Block::operator==(const Block &other) const
{
    return start == other.start && end == other.end && kind == other.kind && location == other.location
        && access == other.access && owner == other.owner;
}

FreeTimeLedger::FreeTimeLedger() = default;

FreeTimeLedger::FreeTimeLedger(const data::PlanningHorizon &horizon, int dayStartMinute, int dayEndMinute,
                               const data::GeoPoint &home, const std::vector<data::CalendarEvent> &events)
    : m_horizon(horizon)
    , m_dayStartMinute(dayStartMinute)
    , m_dayEndMinute(dayEndMinute)
    , m_home(home)
{
    for (const auto &event : events) {
        if (!event.start.isValid() || !event.end.isValid() || event.end <= event.start) {
            qCWarning(lcScheduler) << "Skipping calendar event with invalid range" << event.title;
            continue;
        }
        Block block;
        block.start = event.start;
        block.end = event.end;
        block.owner = event.id;
        if (event.hasResolvableLocation()) {
            block.kind = BlockKind::Located;
            block.location = *event.coordinate;
        } else if (event.ignorable) {
            continue;
        } else {
            block.kind = BlockKind::Opaque;
            block.location = m_home;
        }
        m_calendarBlocks.push_back(block);
    }
    rebuild();
}

const std::vector<FreeInterval> &FreeTimeLedger::intervals() const
{
    return m_intervals;
}

std::vector<FreeInterval> FreeTimeLedger::intervalsWithin(const QDateTime &from, const QDateTime &to) const
{
    std::vector<FreeInterval> result;
    for (const auto &interval : m_intervals) {
        if (interval.end <= from) {
            continue;
        }
        if (interval.start >= to) {
            break;
        }
        result.push_back(interval);
    }
    return result;
}

bool FreeTimeLedger::reserve(const QDateTime &start, const QDateTime &end, const data::ErrandInstance &instance)
{
    if (contains(instance.id) || !isFree(start, end)) {
        return false;
    }
    Block block;
    block.start = start;
    block.end = end;
    block.owner = instance.id;
    if (instance.definition) {
        block.access = instance.definition->access;
    }
    if (instance.location) {
        block.kind = BlockKind::Located;
        block.location = *instance.location;
    } else {
        block.kind = BlockKind::PassThrough;
    }
    m_reservations.push_back(block);
    rebuild();
    return true;
}

bool FreeTimeLedger::release(const QUuid &instanceId)
{
    const auto it = std::find_if(m_reservations.begin(), m_reservations.end(),
                                 [&instanceId](const Block &block) { return block.owner == instanceId; });
    if (it == m_reservations.end()) {
        return false;
    }
    m_reservations.erase(it);
    rebuild();
    return true;
}

bool FreeTimeLedger::contains(const QUuid &instanceId) const
{
    return std::any_of(m_reservations.begin(), m_reservations.end(),
                       [&instanceId](const Block &block) { return block.owner == instanceId; });
}

bool FreeTimeLedger::isFree(const QDateTime &start, const QDateTime &end) const
{
    if (!start.isValid() || !end.isValid() || end < start) {
        return false;
    }
    for (const auto &interval : m_intervals) {
        if (interval.start <= start && end <= interval.end) {
            return true;
        }
    }
    return false;
}

LocationContext FreeTimeLedger::locationAt(const QDateTime &time) const
{
    LocationContext context{m_home, true, dayStart(time.date())};
    QDateTime latestEnd;
    for (const Block *block : blocksOn(time.date())) {
        if (block->end > time || !movesUser(*block, latestEnd)) {
            continue;
        }
        latestEnd = block->end;
        context.location = block->location;
        context.known = block->kind == BlockKind::Located;
        context.since = std::max(block->end, context.since);
    }
    return context;
}

const data::GeoPoint &FreeTimeLedger::home() const
{
    return m_home;
}

const data::PlanningHorizon &FreeTimeLedger::horizon() const
{
    return m_horizon;
}

bool FreeTimeLedger::operator==(const FreeTimeLedger &other) const
{
    return m_intervals == other.m_intervals && m_reservations == other.m_reservations
        && m_calendarBlocks == other.m_calendarBlocks;
}

QDateTime FreeTimeLedger::dayStart(const QDate &day) const
{
    return QDateTime(day, QTime(0, 0)).addSecs(60 * m_dayStartMinute);
}

QDateTime FreeTimeLedger::dayEnd(const QDate &day) const
{
    return QDateTime(day, QTime(0, 0)).addSecs(60 * m_dayEndMinute);
}

bool FreeTimeLedger::movesUser(const Block &block, const QDateTime &latestEnd)
{
    return block.kind != BlockKind::PassThrough && (!latestEnd.isValid() || block.end >= latestEnd);
}

std::vector<const FreeTimeLedger::Block *> FreeTimeLedger::blocksOn(const QDate &day) const
{
    const QDateTime from(day, QTime(0, 0));
    const QDateTime to = from.addDays(1);
    std::vector<const Block *> blocks;
    for (const auto &block : m_calendarBlocks) {
        if (block.start < to && block.end > from) {
            blocks.push_back(&block);
        }
    }
    for (const auto &block : m_reservations) {
        if (block.start < to && block.end > from) {
            blocks.push_back(&block);
        }
    }
    std::sort(blocks.begin(), blocks.end(), [](const Block *a, const Block *b) {
        if (a->start != b->start) {
            return a->start < b->start;
        }
        if (a->end != b->end) {
            return a->end < b->end;
        }
        return a->owner < b->owner;
    });
    return blocks;
}

void FreeTimeLedger::rebuild()
{
    m_intervals.clear();
    if (!m_horizon.isValid()) {
        return;
    }

    for (QDate day = m_horizon.first; day <= m_horizon.last; day = day.addDays(1)) {
        const QDateTime open = dayStart(day);
        const QDateTime close = dayEnd(day);
        const auto blocks = blocksOn(day);

        QDateTime cursor = open;
        QDateTime latestEnd;
        data::GeoPoint location = m_home;
        bool known = true;

        for (std::size_t i = 0; i < blocks.size(); ++i) {
            const Block *block = blocks[i];
            if (block->start > cursor && cursor < close) {
                FreeInterval interval;
                interval.start = cursor;
                interval.end = std::min(block->start, close);
                interval.origin = location;
                interval.originKnown = known;
                // Remote errands do not move the user; look past them.
                for (std::size_t j = i; j < blocks.size(); ++j) {
                    if (blocks[j]->kind != BlockKind::PassThrough) {
                        interval.next = blocks[j]->location;
                        interval.nextAccess = blocks[j]->access;
                        break;
                    }
                }
                m_intervals.push_back(interval);
            }
            // Blocks that end before the day opens still decide where it starts.
            if (movesUser(*block, latestEnd)) {
                latestEnd = block->end;
                location = block->location;
                known = block->kind == BlockKind::Located;
            }
            cursor = std::max(cursor, block->end);
        }

        if (cursor < close) {
            FreeInterval interval;
            interval.start = cursor;
            interval.end = close;
            interval.origin = location;
            interval.originKnown = known;
            m_intervals.push_back(interval);
        }
    }
}

} // namespace scheduling
} // namespace errandplan
