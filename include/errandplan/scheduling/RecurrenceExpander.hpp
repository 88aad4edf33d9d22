#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "errandplan/data/Errand.hpp"
#include "errandplan/data/Event.hpp"

namespace errandplan {
namespace scheduling {

struct Occurrence
{
    QDate target;
    // Dates the instance may be placed on: target ± tolerance, clipped to the horizon.
    QDate earliest;
    QDate latest;
};

// Lazily walks the candidate dates of one definition inside a horizon.
// Spacing-driven rules hand out one date at a time and wait for confirm()
// before computing the next one from the date actually used.
class RecurrenceCursor
{
public:
    std::optional<Occurrence> next();
    void confirm(const QDate &usedDate);

    bool isSpacingDriven() const;
    bool isExhausted() const;

private:
    friend class RecurrenceExpander;

    bool matches(const QDate &date) const;
    std::optional<QDate> nextCalendarDate(const QDate &from) const;
    Occurrence occurrenceFor(const QDate &target) const;

    data::RepetitionRule m_rule;
    data::IntervalRange m_interval;
    data::PlanningHorizon m_horizon;
    QDate m_fixedDate;
    QDate m_anchor;
    QDate m_cursor;
    int m_spacingDays = 0;
    bool m_spacingDriven = false;
    bool m_waiting = false;
    bool m_exhausted = false;
};

class RecurrenceExpander
{
public:
    // Returns std::nullopt and fills *error when the rule is internally
    // inconsistent.
    std::optional<RecurrenceCursor> expand(const data::ErrandDefinition &definition,
                                           const data::PlanningHorizon &horizon,
                                           QString *error = nullptr) const;

    static bool validateRule(const data::ErrandDefinition &definition, QString *error = nullptr);
};

} // namespace scheduling
} // namespace errandplan
