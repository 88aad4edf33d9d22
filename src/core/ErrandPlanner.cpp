#include "errandplan/core/ErrandPlanner.hpp"

#include "errandplan/core/CancellationToken.hpp"
#include "errandplan/core/Logging.hpp"
#include "errandplan/data/CalendarProvider.hpp"
#include "errandplan/data/ErrandRepository.hpp"
#include "errandplan/scheduling/PriorityScheduler.hpp"

#include <utility>

namespace errandplan {
namespace core {

ErrandPlanner::ErrandPlanner(data::ErrandRepository &errands, data::CalendarProvider &calendar,
                             const data::TravelTimeProvider &travel, const data::LocationResolver &locations,
                             data::EstimationSink &estimations, SchedulerSettings settings)
    : m_errands(errands)
    , m_calendar(calendar)
    , m_travel(travel)
    , m_locations(locations)
    , m_estimations(estimations)
    , m_settings(std::move(settings))
{
}

scheduling::SchedulingResult ErrandPlanner::schedule(const data::PlanningHorizon &horizon,
                                                     const CancellationToken *cancel)
{
    return schedule(m_errands.fetchDefinitions(), horizon, m_calendar.busyEvents(horizon), cancel);
}

scheduling::SchedulingResult ErrandPlanner::schedule(const std::vector<data::ErrandDefinition> &definitions,
                                                     const data::PlanningHorizon &horizon,
                                                     const std::vector<data::CalendarEvent> &calendar,
                                                     const CancellationToken *cancel)
{
    // The scheduler hands out pointers into this vector; keep the previous
    // one alive until the pinned instances point at the new copy.
    std::vector<data::ErrandDefinition> fresh = definitions;
    const auto initial = carriedOver(fresh);

    const scheduling::PriorityScheduler scheduler(m_travel, m_locations, m_settings);
    auto result = scheduler.run(fresh, horizon, calendar, initial, cancel);
    if (result.cancelled) {
        qCInfo(lcPlanner) << "Keeping the previous schedule after a cancelled pass";
        result.state = m_lastResult.state;
        return result;
    }

    // Moving the vector keeps its buffer, so the instance pointers stay valid.
    m_definitions = std::move(fresh);
    m_lastResult = result;
    return result;
}

scheduling::ScheduleState ErrandPlanner::carriedOver(const std::vector<data::ErrandDefinition> &definitions) const
{
    scheduling::ScheduleState state = m_lastResult.state;
    for (const auto &instance : m_lastResult.state.instances()) {
        if (!instance.pinned) {
            state.remove(instance.id);
        }
    }
    const int dropped = state.rebind(definitions);
    if (dropped > 0) {
        qCInfo(lcPlanner) << "Dropped" << dropped << "confirmed instance(s) of deleted errands";
    }
    return state;
}

bool ErrandPlanner::confirmInstance(const QUuid &instanceId)
{
    if (!m_lastResult.state.setPinned(instanceId, true)) {
        qCWarning(lcPlanner) << "Cannot confirm unknown instance" << instanceId;
        return false;
    }
    for (auto &instance : m_lastResult.placedInstances) {
        if (instance.id == instanceId) {
            instance.pinned = true;
        }
    }
    return true;
}

bool ErrandPlanner::reportCompletion(const QUuid &instanceId, int actualDurationMinutes, int actualTravelMinutes)
{
    if (actualDurationMinutes < 0 || actualTravelMinutes < 0 || !m_lastResult.state.contains(instanceId)) {
        qCWarning(lcPlanner) << "Ignoring completion report for" << instanceId;
        return false;
    }
    return reportActualTime(instanceId, data::ActualTimeField::Duration, actualDurationMinutes)
        && reportActualTime(instanceId, data::ActualTimeField::TravelTime, actualTravelMinutes);
}

bool ErrandPlanner::reportActualTime(const QUuid &instanceId, data::ActualTimeField field, int minutes)
{
    const auto *instance = m_lastResult.state.find(instanceId);
    if (!instance || minutes < 0) {
        qCWarning(lcPlanner) << "Ignoring actual time for" << instanceId;
        return false;
    }
    m_estimations.record(data::ActualTimeReport{instanceId, instance->definitionId(), field, minutes});
    return true;
}

const scheduling::SchedulingResult &ErrandPlanner::lastResult() const
{
    return m_lastResult;
}

const std::vector<data::ErrandDefinition> &ErrandPlanner::definitions() const
{
    return m_definitions;
}

const SchedulerSettings &ErrandPlanner::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace errandplan
