#pragma once

#include <QUuid>
#include <vector>

#include "errandplan/core/SchedulerSettings.hpp"
#include "errandplan/data/ErrandInstance.hpp"
#include "errandplan/data/EstimationSink.hpp"
#include "errandplan/data/Event.hpp"
#include "errandplan/scheduling/SchedulingResult.hpp"

namespace errandplan {
namespace data {
class CalendarProvider;
class ErrandRepository;
class LocationResolver;
class TravelTimeProvider;
}

namespace core {

class CancellationToken;

// Entry point for callers. Owns the definitions of the latest pass so the
// instances in lastResult() stay valid until the next successful pass.
class ErrandPlanner
{
public:
    ErrandPlanner(data::ErrandRepository &errands, data::CalendarProvider &calendar,
                  const data::TravelTimeProvider &travel, const data::LocationResolver &locations,
                  data::EstimationSink &estimations, SchedulerSettings settings = SchedulerSettings());

    scheduling::SchedulingResult schedule(const data::PlanningHorizon &horizon,
                                          const CancellationToken *cancel = nullptr);
    scheduling::SchedulingResult schedule(const std::vector<data::ErrandDefinition> &definitions,
                                          const data::PlanningHorizon &horizon,
                                          const std::vector<data::CalendarEvent> &calendar,
                                          const CancellationToken *cancel = nullptr);

    // Pinned instances are carried into later passes and never displaced.
    bool confirmInstance(const QUuid &instanceId);

    bool reportCompletion(const QUuid &instanceId, int actualDurationMinutes, int actualTravelMinutes);
    bool reportActualTime(const QUuid &instanceId, data::ActualTimeField field, int minutes);

    const scheduling::SchedulingResult &lastResult() const;
    const std::vector<data::ErrandDefinition> &definitions() const;
    const SchedulerSettings &settings() const;

private:
    scheduling::ScheduleState carriedOver(const std::vector<data::ErrandDefinition> &definitions) const;

    data::ErrandRepository &m_errands;
    data::CalendarProvider &m_calendar;
    const data::TravelTimeProvider &m_travel;
    const data::LocationResolver &m_locations;
    data::EstimationSink &m_estimations;
    SchedulerSettings m_settings;
    std::vector<data::ErrandDefinition> m_definitions;
    scheduling::SchedulingResult m_lastResult;
};

} // namespace core
} // namespace errandplan
