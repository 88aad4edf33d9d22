#pragma once

#include <vector>

#include "errandplan/data/Event.hpp"

namespace errandplan {
namespace data {

class CalendarProvider
{
public:
    virtual ~CalendarProvider() = default;

    virtual std::vector<CalendarEvent> busyEvents(const PlanningHorizon &horizon) const = 0;
};

} // namespace data
} // namespace errandplan
