#include "errandplan/scheduling/RecurrenceExpander.hpp"

#include "errandplan/core/Logging.hpp"

#include <algorithm>

namespace errandplan {
namespace scheduling {

namespace {
constexpr int MinutesPerDay = 24 * 60;

QDate mondayOf(const QDate &date)
{
    return date.addDays(1 - date.dayOfWeek());
}

int monthsBetween(const QDate &from, const QDate &to)
{
    return (to.year() - from.year()) * 12 + (to.month() - from.month());
}

int clampedDay(int day, const QDate &inMonth)
{
    return std::min(day, inMonth.daysInMonth());
}

// Longest gap in days between two consecutive dates the rule can produce.
int longestPeriodDays(const data::RepetitionRule &rule)
{
    switch (rule.kind) {
    case data::RepeatKind::None:
        return 0;
    case data::RepeatKind::Daily:
        return 1;
    case data::RepeatKind::EveryNDays:
        return rule.every;
    case data::RepeatKind::Weekly:
    case data::RepeatKind::WeeklyOnDays:
        return 7 * rule.every;
    case data::RepeatKind::Monthly:
    case data::RepeatKind::MonthlyOnDays:
        return 31 * rule.every;
    case data::RepeatKind::Yearly:
    case data::RepeatKind::YearlyOnDays:
        return 366 * rule.every;
    }
    return 0;
}

bool allowedRange(data::RepeatKind kind, int *minimum, int *maximum)
{
    switch (kind) {
    case data::RepeatKind::WeeklyOnDays:
        *minimum = 1;
        *maximum = 7;
        return true;
    case data::RepeatKind::MonthlyOnDays:
        *minimum = 1;
        *maximum = 31;
        return true;
    case data::RepeatKind::YearlyOnDays:
        *minimum = 1;
        *maximum = 366;
        return true;
    default:
        return false;
    }
}

bool hasAllowedDaySet(data::RepeatKind kind)
{
    int minimum = 0;
    int maximum = 0;
    return allowedRange(kind, &minimum, &maximum);
}
} // namespace

std::optional<Occurrence> RecurrenceCursor::next()
{
    if (m_exhausted || m_waiting) {
        return std::nullopt;
    }

    if (m_rule.kind == data::RepeatKind::None) {
        m_exhausted = true;
        if (!m_fixedDate.isValid()) {
            return Occurrence{m_horizon.first, m_horizon.first, m_horizon.last};
        }
        if (!m_horizon.contains(m_fixedDate)) {
            return std::nullopt;
        }
        return occurrenceFor(m_fixedDate);
    }

    std::optional<QDate> target;
    if (m_spacingDriven) {
        // Spaced dates of an on-days rule move forward to the next allowed day.
        if (hasAllowedDaySet(m_rule.kind)) {
            target = nextCalendarDate(m_cursor);
        } else if (m_cursor <= m_horizon.last) {
            target = m_cursor;
        }
    } else {
        target = nextCalendarDate(m_cursor);
    }

    if (!target) {
        m_exhausted = true;
        return std::nullopt;
    }
    if (m_spacingDriven) {
        m_waiting = true;
    } else {
        m_cursor = target->addDays(1);
    }
    return occurrenceFor(*target);
}

void RecurrenceCursor::confirm(const QDate &usedDate)
{
    if (!m_spacingDriven || !m_waiting) {
        return;
    }
    m_waiting = false;
    m_cursor = usedDate.addDays(m_spacingDays);
    qCDebug(lcRecurrence) << "Next spaced occurrence on" << m_cursor.toString(Qt::ISODate);
}

bool RecurrenceCursor::isSpacingDriven() const
{
    return m_spacingDriven;
}

bool RecurrenceCursor::isExhausted() const
{
    return m_exhausted;
}

bool RecurrenceCursor::matches(const QDate &date) const
{
    if (date < m_anchor) {
        return false;
    }
    const int every = std::max(1, m_rule.every);
    switch (m_rule.kind) {
    case data::RepeatKind::None:
        return date == m_fixedDate;
    case data::RepeatKind::Daily:
        return true;
    case data::RepeatKind::EveryNDays:
        return m_anchor.daysTo(date) % every == 0;
    case data::RepeatKind::Weekly: {
        const qint64 days = m_anchor.daysTo(date);
        return days % 7 == 0 && (days / 7) % every == 0;
    }
    case data::RepeatKind::WeeklyOnDays: {
        const qint64 weeks = mondayOf(m_anchor).daysTo(mondayOf(date)) / 7;
        return weeks % every == 0 && m_rule.allowedDays.contains(date.dayOfWeek());
    }
    case data::RepeatKind::Monthly:
        return monthsBetween(m_anchor, date) % every == 0 && date.day() == clampedDay(m_anchor.day(), date);
    case data::RepeatKind::MonthlyOnDays:
        if (monthsBetween(m_anchor, date) % every != 0) {
            return false;
        }
        return std::any_of(m_rule.allowedDays.cbegin(), m_rule.allowedDays.cend(),
                           [&date](int day) { return clampedDay(day, date) == date.day(); });
    case data::RepeatKind::Yearly:
        return (date.year() - m_anchor.year()) % every == 0 && date.month() == m_anchor.month()
            && date.day() == clampedDay(m_anchor.day(), date);
    case data::RepeatKind::YearlyOnDays:
        return (date.year() - m_anchor.year()) % every == 0 && m_rule.allowedDays.contains(date.dayOfYear());
    }
    return false;
}

std::optional<QDate> RecurrenceCursor::nextCalendarDate(const QDate &from) const
{
    for (QDate date = from; date <= m_horizon.last; date = date.addDays(1)) {
        if (matches(date)) {
            return date;
        }
    }
    return std::nullopt;
}

Occurrence RecurrenceCursor::occurrenceFor(const QDate &target) const
{
    const int tolerance = m_interval.toleranceDays;
    Occurrence occurrence;
    occurrence.target = target;
    occurrence.earliest = std::max(target.addDays(-tolerance), m_horizon.first);
    occurrence.latest = std::min(target.addDays(tolerance), m_horizon.last);
    return occurrence;
}

std::optional<RecurrenceCursor> RecurrenceExpander::expand(const data::ErrandDefinition &definition,
                                                           const data::PlanningHorizon &horizon,
                                                           QString *error) const
{
    if (!horizon.isValid()) {
        if (error) {
            *error = QStringLiteral("Planning horizon is empty");
        }
        return std::nullopt;
    }
    if (!validateRule(definition, error)) {
        return std::nullopt;
    }

    const auto &rule = definition.repetition;
    RecurrenceCursor cursor;
    cursor.m_rule = rule;
    cursor.m_interval = definition.interval;
    cursor.m_horizon = horizon;
    cursor.m_fixedDate = definition.date;
    cursor.m_anchor = rule.anchor.isValid() ? rule.anchor : horizon.first;
    cursor.m_cursor = std::max(cursor.m_anchor, horizon.first);

    if (rule.kind != data::RepeatKind::None
        && (rule.kind == data::RepeatKind::EveryNDays || definition.interval.targetDays > 0)) {
        cursor.m_spacingDriven = true;
        cursor.m_spacingDays = definition.interval.targetDays > 0 ? definition.interval.targetDays : rule.every;
        // The first spaced date still honours the calendar rule.
        const auto first = cursor.nextCalendarDate(cursor.m_cursor);
        if (first) {
            cursor.m_cursor = *first;
        } else {
            cursor.m_exhausted = true;
        }

        // The spacing brings a second occurrence into the horizon, but the
        // minimum gap pushes it past the end.
        const int gapMinutes = definition.interval.minimumGapMinutes;
        const qint64 horizonMinutes = qint64(horizon.first.daysTo(horizon.last) + 1) * MinutesPerDay;
        if (first && gapMinutes > horizonMinutes
            && first->addDays(cursor.m_spacingDays - definition.interval.toleranceDays) <= horizon.last) {
            if (error) {
                *error = QStringLiteral("Minimum interval of %1 min leaves no slot for the next %2 occurrence "
                                        "within the %3-day horizon")
                             .arg(gapMinutes)
                             .arg(data::repeatKindName(rule.kind))
                             .arg(horizon.first.daysTo(horizon.last) + 1);
            }
            return std::nullopt;
        }
    }

    qCDebug(lcRecurrence) << "Expanding" << definition.title << data::repeatKindName(rule.kind)
                          << (cursor.m_spacingDriven ? "spacing-driven" : "calendar-driven");
    return cursor;
}

bool RecurrenceExpander::validateRule(const data::ErrandDefinition &definition, QString *error)
{
    const auto &rule = definition.repetition;
    const auto &interval = definition.interval;
    QString problem;

    int minimum = 0;
    int maximum = 0;
    if (rule.every < 1) {
        problem = QStringLiteral("Repeat multiplier must be at least 1");
    } else if (allowedRange(rule.kind, &minimum, &maximum)) {
        if (rule.allowedDays.isEmpty()) {
            problem = QStringLiteral("%1 rule has no allowed days").arg(data::repeatKindName(rule.kind));
        } else {
            for (int day : rule.allowedDays) {
                if (day < minimum || day > maximum) {
                    problem = QStringLiteral("Allowed day %1 is outside %2-%3").arg(day).arg(minimum).arg(maximum);
                    break;
                }
            }
        }
    }

    if (problem.isEmpty()) {
        if (interval.targetDays < 0 || interval.toleranceDays < 0 || interval.minimumGapMinutes < 0) {
            problem = QStringLiteral("Interval range values must not be negative");
        } else if (interval.targetDays > 0 && interval.toleranceDays >= interval.targetDays) {
            problem = QStringLiteral("Tolerance of %1 days swallows the target spacing of %2 days")
                          .arg(interval.toleranceDays)
                          .arg(interval.targetDays);
        } else if (rule.kind != data::RepeatKind::None && interval.minimumGapMinutes > 0) {
            const int period = interval.targetDays > 0 ? interval.targetDays : longestPeriodDays(rule);
            const qint64 longest = qint64(period + 2 * interval.toleranceDays) * MinutesPerDay
                + definition.window.length();
            if (interval.minimumGapMinutes > longest) {
                problem = QStringLiteral("Minimum interval of %1 min can never be met by a %2 rule")
                              .arg(interval.minimumGapMinutes)
                              .arg(data::repeatKindName(rule.kind));
            }
        }
    }

    if (problem.isEmpty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

} // namespace scheduling
} // namespace errandplan
