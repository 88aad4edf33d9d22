#pragma once

#include <QHash>
#include <optional>

#include "errandplan/data/CalendarProvider.hpp"

namespace errandplan {
namespace data {

class InMemoryCalendarProvider : public CalendarProvider
{
public:
    InMemoryCalendarProvider();
    ~InMemoryCalendarProvider() override;

    std::vector<CalendarEvent> busyEvents(const PlanningHorizon &horizon) const override;

    std::optional<CalendarEvent> findById(const QUuid &id) const;
    CalendarEvent addEvent(CalendarEvent event);
    bool updateEvent(const CalendarEvent &event);
    bool removeEvent(const QUuid &id);

private:
    QHash<QUuid, CalendarEvent> m_events;
};

} // namespace data
} // namespace errandplan
