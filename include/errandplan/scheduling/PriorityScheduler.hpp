#pragma once

#include <vector>

#include "errandplan/core/SchedulerSettings.hpp"
#include "errandplan/data/Errand.hpp"
#include "errandplan/data/Event.hpp"
#include "errandplan/scheduling/SchedulingResult.hpp"

namespace errandplan {
namespace core {
class CancellationToken;
}

namespace data {
class LocationResolver;
class TravelTimeProvider;
}

namespace scheduling {

// Drives one planning pass: expands every definition, then places instances
// one at a time, highest priority tier first. Each instance is processed
// exactly once; identical inputs always produce the identical schedule.
class PriorityScheduler
{
public:
    PriorityScheduler(const data::TravelTimeProvider &travel, const data::LocationResolver &locations,
                      core::SchedulerSettings settings);

    // `definitions` must outlive the returned result; instances refer back to them.
    SchedulingResult run(const std::vector<data::ErrandDefinition> &definitions,
                         const data::PlanningHorizon &horizon, const std::vector<data::CalendarEvent> &calendar,
                         const ScheduleState &initial = ScheduleState(),
                         const core::CancellationToken *cancel = nullptr) const;

    const core::SchedulerSettings &settings() const;

private:
    const data::TravelTimeProvider &m_travel;
    const data::LocationResolver &m_locations;
    core::SchedulerSettings m_settings;
};

} // namespace scheduling
} // namespace errandplan
