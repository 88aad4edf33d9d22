#include "errandplan/scheduling/PlacementSearch.hpp"

#include "errandplan/core/Logging.hpp"
#include "errandplan/scheduling/TravelEstimator.hpp"

#include <QSet>
#include <QThread>
#include <QVector>
#include <QtConcurrent/QtConcurrentMap>
#include <algorithm>
#include <functional>

namespace errandplan {
namespace scheduling {

namespace {
template<class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

QDateTime atMinute(const QDate &day, int minute)
{
    return QDateTime(day, QTime(0, 0)).addSecs(60 * minute);
}

int minutesBetween(const QDateTime &from, const QDateTime &to)
{
    return static_cast<int>(from.secsTo(to) / 60);
}

int transfersOf(const Placement &placement)
{
    return placement.travelIn.transfers + (placement.travelOut ? placement.travelOut->transfers : 0);
}

QSet<QDate> sameDayBlockedDates(const data::ErrandDefinition &definition, const ScheduleState &state)
{
    QSet<QDate> dates;
    for (const auto &other : state.instances()) {
        if (!other.definition || other.definition->id == definition.id) {
            continue;
        }
        if (definition.conflictsWith.contains(other.definition->id)
            || other.definition->conflictsWith.contains(definition.id)) {
            dates.insert(other.start.date());
        }
    }
    return dates;
}
} // namespace

PlacementSearch::PlacementSearch(const TravelEstimator &travel, const data::LocationResolver &resolver,
                                 const core::SchedulerSettings &settings)
    : m_travel(travel)
    , m_resolver(resolver)
    , m_settings(settings)
{
}

PlacementResult PlacementSearch::place(const data::ErrandInstance &instance, const ScheduleState &state,
                                       const FreeTimeLedger &ledger) const
{
    const auto *definition = instance.definition;
    if (!definition) {
        return PlacementResult{std::nullopt, BlockingReason::TimeWindowConflict};
    }

    const auto target = resolveTarget(*definition, ledger);
    if (!target) {
        qCDebug(lcPlacement) << "Could not resolve a location for" << definition->title;
        return PlacementResult{std::nullopt, BlockingReason::AccessTypeInfeasible};
    }

    auto result = search(instance, *target, state, ledger, definition->durationMinutes);
    const int minimum = definition->minimumDurationMinutes;
    if (!result.scheduled() && minimum > 0 && minimum < definition->durationMinutes) {
        auto shortened = search(instance, *target, state, ledger, minimum);
        if (shortened.scheduled()) {
            qCDebug(lcPlacement) << definition->title << "only fits with a shortened duration";
            return shortened;
        }
    }
    return result;
}

std::optional<PlacementSearch::Target> PlacementSearch::resolveTarget(const data::ErrandDefinition &definition,
                                                                      const FreeTimeLedger &ledger) const
{
    return std::visit(
        Overloaded{
            [](const data::ExactLocation &exact) -> std::optional<Target> {
                return Target{false, false, exact.point, exact.label};
            },
            [&](const data::NamedPlace &place) -> std::optional<Target> {
                if (place.point) {
                    return Target{false, false, place.point, place.name};
                }
                const auto found = queryLocations(definition.location, ledger.home(), definition.window.length());
                if (!found || found->empty()) {
                    return std::nullopt;
                }
                const auto &first = found->front();
                return Target{false, false, first.point, first.label.isEmpty() ? place.name : first.label};
            },
            [](const data::StoreCategory &store) -> std::optional<Target> {
                return Target{false, true, std::nullopt, store.category};
            },
            [](const data::RemoteLocation &) -> std::optional<Target> {
                return Target{true, false, std::nullopt, QString()};
            },
        },
        definition.location);
}

PlacementResult PlacementSearch::search(const data::ErrandInstance &instance, const Target &target,
                                        const ScheduleState &state, const FreeTimeLedger &ledger,
                                        int minimumDuration) const
{
    const auto &definition = *instance.definition;
    const QSet<QDate> blockedDates = sameDayBlockedDates(definition, state);

    QVector<Candidate> candidates;
    bool sameDayConflict = false;
    for (QDate day = instance.earliestDate; day <= instance.latestDate; day = day.addDays(1)) {
        const QDateTime windowStart = atMinute(day, definition.window.startMinute);
        const QDateTime windowEnd = atMinute(day, definition.window.endMinute);
        for (const auto &interval : ledger.intervalsWithin(windowStart, windowEnd)) {
            const QDateTime usableStart = std::max(interval.start, windowStart);
            const QDateTime usableEnd = std::min(interval.end, windowEnd);
            if (minutesBetween(usableStart, usableEnd) < minimumDuration) {
                continue;
            }
            if (blockedDates.contains(day)) {
                sameDayConflict = true;
                continue;
            }
            if (candidates.size() >= m_settings.maxCandidateIntervals) {
                break;
            }
            candidates.append(Candidate{interval, windowStart, windowEnd});
        }
    }

    std::function<Evaluation(const Candidate &)> evaluateOne = [&](const Candidate &candidate) {
        return evaluate(instance, target, candidate, state, minimumDuration);
    };

    QVector<Evaluation> evaluations;
    if (m_settings.concurrentQueries && candidates.size() > 1 && !target.remote) {
        evaluations = QtConcurrent::blockingMapped<QVector<Evaluation>>(candidates, evaluateOne);
    } else {
        evaluations.reserve(candidates.size());
        for (const auto &candidate : candidates) {
            evaluations.append(evaluateOne(candidate));
        }
    }

    PlacementResult result;
    bool spacingBlocked = false;
    bool travelInfeasible = false;
    for (const auto &evaluation : evaluations) {
        spacingBlocked = spacingBlocked || evaluation.spacingBlocked;
        travelInfeasible = travelInfeasible || evaluation.travelInfeasible;
        if (evaluation.best && (!result.placement || isBetter(*evaluation.best, *result.placement))) {
            result.placement = evaluation.best;
        }
    }

    if (result.placement) {
        qCDebug(lcPlacement) << definition.title << "fits at" << result.placement->start.toString(Qt::ISODate)
                             << result.placement->locationLabel << "travel cost" << result.placement->cost;
        return result;
    }

    if (spacingBlocked) {
        result.reason = BlockingReason::IntervalSpacingConflict;
    } else if (sameDayConflict) {
        result.reason = BlockingReason::SameDayConflict;
    } else if (travelInfeasible) {
        result.reason = BlockingReason::AccessTypeInfeasible;
    } else {
        result.reason = BlockingReason::TimeWindowConflict;
    }
    qCDebug(lcPlacement) << "No feasible slot for" << definition.title << "on"
                         << instance.targetDate.toString(Qt::ISODate) << "-" << blockingReasonName(result.reason)
                         << "after" << candidates.size() << "candidate intervals";
    return result;
}

PlacementSearch::Evaluation PlacementSearch::evaluate(const data::ErrandInstance &instance, const Target &target,
                                                      const Candidate &candidate, const ScheduleState &state,
                                                      int minimumDuration) const
{
    Evaluation evaluation;
    if (!target.open) {
        evaluation.best = fit(instance, candidate, target.point, target.label, state, minimumDuration, evaluation);
        return evaluation;
    }

    const auto &definition = *instance.definition;
    const int budget = candidate.interval.minutes() - minimumDuration;
    const auto found = queryLocations(definition.location, candidate.interval.origin, budget);
    if (!found || found->empty()) {
        evaluation.travelInfeasible = true;
        return evaluation;
    }

    const int limit = std::min(static_cast<int>(found->size()), m_settings.maxCandidateLocations);
    for (int i = 0; i < limit; ++i) {
        const auto &location = (*found)[static_cast<std::size_t>(i)];
        auto placement = fit(instance, candidate, location.point, location.label, state, minimumDuration, evaluation);
        if (placement && (!evaluation.best || isBetter(*placement, *evaluation.best))) {
            evaluation.best = std::move(placement);
        }
    }
    return evaluation;
}

std::optional<Placement> PlacementSearch::fit(const data::ErrandInstance &instance, const Candidate &candidate,
                                              const std::optional<data::GeoPoint> &point, const QString &label,
                                              const ScheduleState &state, int minimumDuration,
                                              Evaluation &evaluation) const
{
    const auto &definition = *instance.definition;
    const auto &interval = candidate.interval;
    const data::AccessType access = definition.access;

    data::TravelSegment travelIn{0, access, 0};
    if (point) {
        const auto segment = m_travel.estimateFrom(interval.origin, interval.originKnown, *point, access,
                                                   interval.start);
        if (!segment) {
            evaluation.travelInfeasible = true;
            return std::nullopt;
        }
        travelIn = *segment;
    }

    QDateTime start = std::max(interval.start.addSecs(60 * travelIn.durationMinutes), candidate.windowStart);

    bool spacingMoved = false;
    const qint64 gap = 60LL * definition.interval.minimumGapMinutes;
    if (gap > 0) {
        const auto siblings = state.instancesOf(definition.id);
        bool moved = true;
        while (moved) {
            moved = false;
            for (const auto *sibling : siblings) {
                if (sibling->id != instance.id && qAbs(sibling->start.secsTo(start)) < gap) {
                    start = sibling->start.addSecs(gap);
                    moved = true;
                    spacingMoved = true;
                }
            }
        }
    }

    auto reject = [&]() -> std::optional<Placement> {
        if (spacingMoved) {
            evaluation.spacingBlocked = true;
        }
        return std::nullopt;
    };

    const QDateTime limit = std::min(candidate.windowEnd, interval.end);
    if (start.addSecs(60 * minimumDuration) > limit) {
        return reject();
    }
    QDateTime end = std::min(start.addSecs(60 * definition.durationMinutes), limit);

    // A remote errand leaves the user where they were, so the way on to the
    // next commitment still has to fit behind it.
    std::optional<data::TravelSegment> travelOut;
    if (interval.next) {
        travelOut = m_travel.estimate(point.value_or(interval.origin), *interval.next,
                                      interval.nextAccess.value_or(access), end);
        if (!travelOut) {
            evaluation.travelInfeasible = true;
            return std::nullopt;
        }
        const QDateTime latestEnd = interval.end.addSecs(-60 * travelOut->durationMinutes);
        if (end > latestEnd) {
            end = latestEnd;
        }
    }
    if (start.secsTo(end) < 60LL * minimumDuration) {
        return reject();
    }

    Placement placement;
    placement.start = start;
    placement.end = end;
    placement.location = point;
    placement.locationLabel = label;
    placement.travelIn = travelIn;
    placement.travelOut = travelOut;
    placement.cost = travelIn.durationMinutes + (travelOut ? travelOut->durationMinutes : 0);
    if (data::isTransit(access)) {
        const int extraTransfers = std::max(0, travelIn.transfers - 1)
            + (travelOut ? std::max(0, travelOut->transfers - 1) : 0);
        placement.cost += extraTransfers * m_settings.transferPenaltyMinutes;
    }
    return placement;
}

std::optional<std::vector<data::LocationCandidate>> PlacementSearch::queryLocations(const data::LocationSpec &spec,
                                                                                    const data::GeoPoint &origin,
                                                                                    int budgetMinutes) const
{
    for (int attempt = 0; attempt <= m_settings.providerRetries; ++attempt) {
        if (attempt > 0 && m_settings.providerBackoffMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_settings.providerBackoffMs) << (attempt - 1));
        }
        QString error;
        auto found = m_resolver.candidates(spec, origin, budgetMinutes, &error);
        if (found) {
            return found;
        }
        qCWarning(lcPlacement) << "Location resolver failed, attempt" << attempt + 1 << ":" << error;
    }
    return std::nullopt;
}

bool PlacementSearch::isBetter(const Placement &candidate, const Placement &incumbent)
{
    if (candidate.cost != incumbent.cost) {
        return candidate.cost < incumbent.cost;
    }
    const int candidateTransfers = transfersOf(candidate);
    const int incumbentTransfers = transfersOf(incumbent);
    if (candidateTransfers != incumbentTransfers) {
        return candidateTransfers < incumbentTransfers;
    }
    if (candidate.start != incumbent.start) {
        return candidate.start < incumbent.start;
    }
    if (candidate.locationLabel != incumbent.locationLabel) {
        return candidate.locationLabel < incumbent.locationLabel;
    }
    const auto candidatePoint = candidate.location.value_or(data::GeoPoint{});
    const auto incumbentPoint = incumbent.location.value_or(data::GeoPoint{});
    if (candidatePoint.latitude != incumbentPoint.latitude) {
        return candidatePoint.latitude < incumbentPoint.latitude;
    }
    return candidatePoint.longitude < incumbentPoint.longitude;
}

} // namespace scheduling
} // namespace errandplan
