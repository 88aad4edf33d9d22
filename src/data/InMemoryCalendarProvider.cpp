#include "errandplan/data/InMemoryCalendarProvider.hpp"

#include <algorithm>

namespace errandplan {
namespace data {

InMemoryCalendarProvider::InMemoryCalendarProvider() = default;
InMemoryCalendarProvider::~InMemoryCalendarProvider() = default;

std::vector<CalendarEvent> InMemoryCalendarProvider::busyEvents(const PlanningHorizon &horizon) const
{
    std::vector<CalendarEvent> events;
    if (!horizon.isValid()) {
        return events;
    }
    for (const auto &event : m_events) {
        if (event.end.date() < horizon.first || event.start.date() > horizon.last) {
            continue;
        }
        events.push_back(event);
    }
    // QHash iteration order is unspecified.
    std::sort(events.begin(), events.end(), [](const CalendarEvent &a, const CalendarEvent &b) {
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return a.id < b.id;
    });
    return events;
}

std::optional<CalendarEvent> InMemoryCalendarProvider::findById(const QUuid &id) const
{
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

CalendarEvent InMemoryCalendarProvider::addEvent(CalendarEvent event)
{
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    if (!event.end.isValid() || event.end <= event.start) {
        event.end = event.start.addSecs(30 * 60);
    }
    m_events.insert(event.id, event);
    return event;
}

bool InMemoryCalendarProvider::updateEvent(const CalendarEvent &event)
{
    if (!m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryCalendarProvider::removeEvent(const QUuid &id)
{
    return m_events.remove(id) > 0;
}

} // namespace data
} // namespace errandplan
