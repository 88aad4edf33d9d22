#include "errandplan/scheduling/CascadeResolver.hpp"

#include "errandplan/core/CancellationToken.hpp"
#include "errandplan/core/Logging.hpp"
#include "errandplan/scheduling/PlacementSearch.hpp"
#include "errandplan/scheduling/ScheduleWriter.hpp"

#include <algorithm>

namespace errandplan {
namespace scheduling {

namespace {
bool cancelled(const core::CancellationToken *cancel)
{
    return cancel && cancel->isCancelled();
}
} // namespace

CascadeResolver::CascadeResolver(const PlacementSearch &search, const ScheduleWriter &writer)
    : m_search(search)
    , m_writer(writer)
{
}

CascadeResult CascadeResolver::resolve(const data::ErrandInstance &instance, const ScheduleState &state,
                                       const FreeTimeLedger &ledger, int depthBudget,
                                       const core::CancellationToken *cancel) const
{
    CascadeResult result;
    const auto direct = m_search.place(instance, state, ledger);
    if (direct.scheduled()) {
        Branch branch{state, ledger, {}};
        if (m_writer.commit(branch.state, branch.ledger, instance, *direct.placement)) {
            result.placed = true;
            result.state = branch.state;
            result.ledger = branch.ledger;
            return result;
        }
    }
    result.reason = direct.scheduled() ? BlockingReason::TimeWindowConflict : direct.reason;

    const QString title = instance.definition ? instance.definition->title : QString();
    // Shallower chains are preferred over deeper ones.
    for (int depth = 1; depth <= depthBudget; ++depth) {
        if (cancelled(cancel)) {
            break;
        }
        auto branch = tryChain(instance, state, ledger, depth, QSet<QUuid>{instance.id}, cancel);
        if (!branch) {
            continue;
        }
        QString error;
        if (!branch->state.verify(&error)) {
            qCWarning(lcCascade) << "Discarding displacement chain for" << title << ":" << error;
            continue;
        }
        qCInfo(lcCascade) << "Placed" << title << "after displacing" << branch->displaced.size() << "instance(s)";
        result.placed = true;
        result.state = std::move(branch->state);
        result.ledger = std::move(branch->ledger);
        result.displaced = std::move(branch->displaced);
        result.reason = BlockingReason::None;
        return result;
    }

    qCDebug(lcCascade) << "Cascade exhausted for" << title << "-" << blockingReasonName(result.reason);
    return result;
}

std::optional<CascadeResolver::Branch> CascadeResolver::tryChain(const data::ErrandInstance &instance,
                                                                 const ScheduleState &state,
                                                                 const FreeTimeLedger &ledger, int depth,
                                                                 const QSet<QUuid> &excluded,
                                                                 const core::CancellationToken *cancel) const
{
    for (const auto *blocker : blockersFor(instance, state, excluded)) {
        if (cancelled(cancel)) {
            return std::nullopt;
        }

        Branch trial{state, ledger, {}};
        auto displaced = m_writer.displace(trial.state, trial.ledger, blocker->id);
        if (!displaced) {
            continue;
        }
        displaced->status = data::InstanceStatus::TentativelyDisplacing;

        const auto placed = m_search.place(instance, trial.state, trial.ledger);
        if (!placed.scheduled() || !m_writer.commit(trial.state, trial.ledger, instance, *placed.placement)) {
            continue;
        }
        trial.displaced.push_back(displaced->id);

        const auto replaced = m_search.place(*displaced, trial.state, trial.ledger);
        if (replaced.scheduled()) {
            if (m_writer.commit(trial.state, trial.ledger, *displaced, *replaced.placement)) {
                qCDebug(lcCascade) << "Moved" << displaced->definition->title << "to"
                                   << replaced.placement->start.toString(Qt::ISODate);
                return trial;
            }
            continue;
        }
        if (depth <= 1) {
            continue;
        }

        QSet<QUuid> chain = excluded;
        chain.insert(displaced->id);
        auto deeper = tryChain(*displaced, trial.state, trial.ledger, depth - 1, chain, cancel);
        if (deeper) {
            trial.state = std::move(deeper->state);
            trial.ledger = std::move(deeper->ledger);
            trial.displaced.insert(trial.displaced.end(), deeper->displaced.begin(), deeper->displaced.end());
            return trial;
        }
    }
    return std::nullopt;
}

std::vector<const data::ErrandInstance *> CascadeResolver::blockersFor(const data::ErrandInstance &instance,
                                                                       const ScheduleState &state,
                                                                       const QSet<QUuid> &excluded) const
{
    const auto *definition = instance.definition;
    std::vector<const data::ErrandInstance *> blockers;
    if (!definition) {
        return blockers;
    }

    const qint64 gap = 60LL * definition->interval.minimumGapMinutes;
    auto consider = [&](const data::ErrandInstance *other) {
        if (other->pinned || excluded.contains(other->id) || other->priority() > instance.priority()) {
            return;
        }
        if (std::find(blockers.begin(), blockers.end(), other) == blockers.end()) {
            blockers.push_back(other);
        }
    };

    for (QDate day = instance.earliestDate; day <= instance.latestDate; day = day.addDays(1)) {
        const QDateTime midnight(day, QTime(0, 0));
        const QDateTime windowStart = midnight.addSecs(60 * definition->window.startMinute);
        const QDateTime windowEnd = midnight.addSecs(60 * definition->window.endMinute);
        for (const auto *other : state.overlapping(windowStart, windowEnd)) {
            consider(other);
        }
        if (gap > 0) {
            for (const auto *sibling : state.overlapping(windowStart.addSecs(-gap), windowEnd.addSecs(gap))) {
                if (sibling->definitionId() == definition->id) {
                    consider(sibling);
                }
            }
        }
    }

    std::sort(blockers.begin(), blockers.end(), [](const data::ErrandInstance *a, const data::ErrandInstance *b) {
        if (a->priority() != b->priority()) {
            return a->priority() < b->priority();
        }
        if (a->start != b->start) {
            return a->start < b->start;
        }
        return a->id < b->id;
    });
    return blockers;
}

} // namespace scheduling
} // namespace errandplan
