#include "errandplan/scheduling/PriorityScheduler.hpp"

#include "errandplan/core/CancellationToken.hpp"
#include "errandplan/core/Logging.hpp"
#include "errandplan/scheduling/CascadeResolver.hpp"
#include "errandplan/scheduling/DefinitionValidator.hpp"
#include "errandplan/scheduling/FreeTimeLedger.hpp"
#include "errandplan/scheduling/PlacementSearch.hpp"
#include "errandplan/scheduling/RecurrenceExpander.hpp"
#include "errandplan/scheduling/ScheduleWriter.hpp"
#include "errandplan/scheduling/TravelEstimator.hpp"

#include <set>
#include <utility>
#include <tuple>

namespace errandplan {
namespace scheduling {

namespace {
struct Pending
{
    int priority = 0;
    QDateTime windowStart;
    int durationMinutes = 0;
    QUuid definitionId;
    QDate target;
    std::size_t slot = 0;
    Occurrence occurrence;

    bool operator<(const Pending &other) const
    {
        // Higher tiers first, then earlier windows, then shorter errands.
        return std::make_tuple(-priority, windowStart, durationMinutes, definitionId, target)
            < std::make_tuple(-other.priority, other.windowStart, other.durationMinutes, other.definitionId,
                              other.target);
    }
};

struct Expansion
{
    const data::ErrandDefinition *definition = nullptr;
    RecurrenceCursor cursor;
};

bool cancelled(const core::CancellationToken *cancel)
{
    return cancel && cancel->isCancelled();
}

SchedulingResult cancelledResult(SchedulingResult result, const ScheduleState &initial)
{
    qCInfo(lcScheduler) << "Planning pass cancelled; no changes committed";
    result.placedInstances.clear();
    result.unschedulable.clear();
    result.state = initial;
    result.cancelled = true;
    return result;
}
} // namespace

PriorityScheduler::PriorityScheduler(const data::TravelTimeProvider &travel, const data::LocationResolver &locations,
                                     core::SchedulerSettings settings)
    : m_travel(travel)
    , m_locations(locations)
    , m_settings(std::move(settings))
{
}

SchedulingResult PriorityScheduler::run(const std::vector<data::ErrandDefinition> &definitions,
                                        const data::PlanningHorizon &horizon,
                                        const std::vector<data::CalendarEvent> &calendar,
                                        const ScheduleState &initial, const core::CancellationToken *cancel) const
{
    SchedulingResult result;
    if (!horizon.isValid()) {
        qCWarning(lcScheduler) << "Refusing to plan an empty horizon";
        result.state = initial;
        return result;
    }

    const TravelEstimator travel(m_travel, m_settings);
    const PlacementSearch search(travel, m_locations, m_settings);
    const ScheduleWriter writer(travel);
    const CascadeResolver cascade(search, writer);
    const RecurrenceExpander expander;

    FreeTimeLedger ledger(horizon, m_settings.dayStartMinute, m_settings.dayEndMinute, m_settings.home, calendar);
    ScheduleState state;
    for (const auto &committed : initial.instances()) {
        if (!writer.adopt(state, ledger, committed)) {
            qCWarning(lcScheduler) << "Committed instance" << committed.id
                                   << "collides with the calendar and will be planned again";
        }
    }

    std::vector<Expansion> expansions;
    expansions.reserve(definitions.size());
    std::set<Pending> pending;

    auto enqueueNext = [&](std::size_t slot) {
        auto &expansion = expansions[slot];
        const auto occurrence = expansion.cursor.next();
        if (!occurrence) {
            return;
        }
        const auto &definition = *expansion.definition;
        Pending entry;
        entry.priority = definition.priority;
        entry.windowStart = QDateTime(occurrence->earliest, QTime(0, 0)).addSecs(60 * definition.window.startMinute);
        entry.durationMinutes = definition.durationMinutes;
        entry.definitionId = definition.id;
        entry.target = occurrence->target;
        entry.slot = slot;
        entry.occurrence = *occurrence;
        pending.insert(entry);
    };

    for (const auto &definition : definitions) {
        QString error;
        if (!validateDefinition(definition, &error)) {
            qCWarning(lcScheduler) << "Rejecting errand" << definition.title << ":" << error;
            result.issues.push_back(DefinitionIssue{definition.id, definition.title, IssueKind::Validation, error});
            continue;
        }
        auto cursor = expander.expand(definition, horizon, &error);
        if (!cursor) {
            qCWarning(lcScheduler) << "Skipping errand" << definition.title << ":" << error;
            result.issues.push_back(
                DefinitionIssue{definition.id, definition.title, IssueKind::InvalidRecurrence, error});
            continue;
        }
        expansions.push_back(Expansion{&definition, std::move(*cursor)});
        enqueueNext(expansions.size() - 1);
    }

    while (!pending.empty()) {
        if (cancelled(cancel)) {
            return cancelledResult(std::move(result), initial);
        }
        const Pending entry = *pending.begin();
        pending.erase(pending.begin());
        auto &expansion = expansions[entry.slot];
        const auto &definition = *expansion.definition;

        auto instance = data::makeInstance(definition, entry.occurrence.target, entry.occurrence.earliest,
                                           entry.occurrence.latest);
        QDate usedDate = entry.target;

        if (const auto *existing = state.find(instance.id)) {
            usedDate = existing->start.date();
        } else {
            const auto direct = search.place(instance, state, ledger);
            bool placed = false;
            if (direct.scheduled()) {
                placed = writer.commit(state, ledger, instance, *direct.placement);
                if (placed) {
                    usedDate = direct.placement->start.date();
                }
            }
            if (!placed) {
                auto outcome = cascade.resolve(instance, state, ledger, m_settings.cascadeDepth, cancel);
                if (cancelled(cancel)) {
                    return cancelledResult(std::move(result), initial);
                }
                if (outcome.placed) {
                    state = std::move(outcome.state);
                    ledger = std::move(outcome.ledger);
                    if (const auto *placedInstance = state.find(instance.id)) {
                        usedDate = placedInstance->start.date();
                    }
                } else {
                    instance.status = data::InstanceStatus::Unschedulable;
                    qCInfo(lcScheduler) << definition.title << "on" << entry.target.toString(Qt::ISODate)
                                        << "is unschedulable:" << blockingReasonName(outcome.reason);
                    result.unschedulable.push_back(UnschedulableInstance{instance, outcome.reason});
                }
            }
        }

        expansion.cursor.confirm(usedDate);
        enqueueNext(entry.slot);
    }

    result.placedInstances = state.instances();
    result.state = state;
    qCInfo(lcScheduler) << "Planned" << result.placedInstances.size() << "instance(s)," << result.unschedulable.size()
                        << "unschedulable," << result.issues.size() << "rejected definition(s),"
                        << travel.providerCalls() << "travel queries";
    return result;
}

const core::SchedulerSettings &PriorityScheduler::settings() const
{
    return m_settings;
}

} // namespace scheduling
} // namespace errandplan
