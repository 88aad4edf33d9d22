#include "errandplan/scheduling/ScheduleWriter.hpp"

#include "errandplan/core/Logging.hpp"
#include "errandplan/scheduling/FreeTimeLedger.hpp"
#include "errandplan/scheduling/PlacementSearch.hpp"
#include "errandplan/scheduling/ScheduleState.hpp"
#include "errandplan/scheduling/TravelEstimator.hpp"

namespace errandplan {
namespace scheduling {

ScheduleWriter::ScheduleWriter(const TravelEstimator &travel)
    : m_travel(travel)
{
}

bool ScheduleWriter::commit(ScheduleState &state, FreeTimeLedger &ledger, data::ErrandInstance instance,
                            const Placement &placement) const
{
    instance.start = placement.start;
    instance.end = placement.end;
    instance.location = placement.location;
    instance.locationLabel = placement.locationLabel;
    instance.travelIn = placement.travelIn;
    return insert(state, ledger, instance);
}

bool ScheduleWriter::adopt(ScheduleState &state, FreeTimeLedger &ledger, const data::ErrandInstance &instance) const
{
    if (!insert(state, ledger, instance)) {
        return false;
    }
    // The calendar may have changed since the instance was planned.
    if (instance.location) {
        const auto segment = travelInFor(ledger, instance);
        if (!segment) {
            qCWarning(lcScheduler) << "Keeping stale travel segment for" << instance.definition->title;
        } else if (segment->durationMinutes != instance.travelIn.durationMinutes
                   || segment->transfers != instance.travelIn.transfers) {
            qCInfo(lcScheduler) << "Travel to" << instance.definition->title << "changed from"
                                << instance.travelIn.durationMinutes << "to" << segment->durationMinutes << "min";
            state.setTravelIn(instance.id, *segment);
        }
    }
    return true;
}

bool ScheduleWriter::insert(ScheduleState &state, FreeTimeLedger &ledger, const data::ErrandInstance &instance) const
{
    if (!ledger.reserve(instance.start, instance.end, instance)) {
        qCWarning(lcScheduler) << "Cannot reserve" << instance.start.toString(Qt::ISODate)
                               << instance.end.toString(Qt::ISODate) << "- range is not free";
        return false;
    }
    if (!state.place(instance)) {
        ledger.release(instance.id);
        qCWarning(lcScheduler) << "Instance" << instance.id << "is already on the timeline";
        return false;
    }
    refreshFollower(state, ledger, instance.end);
    return true;
}

std::optional<data::ErrandInstance> ScheduleWriter::displace(ScheduleState &state, FreeTimeLedger &ledger,
                                                             const QUuid &instanceId) const
{
    auto removed = state.remove(instanceId);
    if (!removed) {
        return std::nullopt;
    }
    ledger.release(instanceId);
    refreshFollower(state, ledger, removed->start);

    removed->status = data::InstanceStatus::Unscheduled;
    removed->start = QDateTime();
    removed->end = QDateTime();
    removed->travelIn = data::TravelSegment{};
    return removed;
}

void ScheduleWriter::refreshFollower(ScheduleState &state, const FreeTimeLedger &ledger,
                                     const QDateTime &after) const
{
    const QDate day = after.date();
    for (const auto &instance : state.instances()) {
        if (instance.start < after) {
            continue;
        }
        if (instance.start.date() != day) {
            return;
        }
        if (!instance.location) {
            continue;
        }
        const auto segment = travelInFor(ledger, instance);
        if (!segment) {
            qCWarning(lcScheduler) << "Keeping stale travel segment for" << instance.definition->title;
            return;
        }
        state.setTravelIn(instance.id, *segment);
        return;
    }
}

std::optional<data::TravelSegment> ScheduleWriter::travelInFor(const FreeTimeLedger &ledger,
                                                               const data::ErrandInstance &instance) const
{
    const auto origin = ledger.locationAt(instance.start);
    return m_travel.estimateFrom(origin.location, origin.known, *instance.location, instance.definition->access,
                                 origin.since);
}

} // namespace scheduling
} // namespace errandplan
