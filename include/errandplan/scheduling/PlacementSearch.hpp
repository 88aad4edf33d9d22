#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "errandplan/core/SchedulerSettings.hpp"
#include "errandplan/data/ErrandInstance.hpp"
#include "errandplan/data/LocationResolver.hpp"
#include "errandplan/scheduling/FreeTimeLedger.hpp"
#include "errandplan/scheduling/ScheduleState.hpp"
#include "errandplan/scheduling/SchedulingResult.hpp"

namespace errandplan {
namespace scheduling {

class TravelEstimator;

struct Placement
{
    QDateTime start;
    QDateTime end;
    std::optional<data::GeoPoint> location;
    QString locationLabel;
    data::TravelSegment travelIn;
    std::optional<data::TravelSegment> travelOut;
    // Travel in and out plus the transfer penalty; lower is better.
    int cost = 0;
};

struct PlacementResult
{
    std::optional<Placement> placement;
    BlockingReason reason = BlockingReason::None;

    bool scheduled() const { return placement.has_value(); }
};

// Finds the best (time, location) pair for one instance against the current
// ledger. Never modifies the state or the ledger.
class PlacementSearch
{
public:
    PlacementSearch(const TravelEstimator &travel, const data::LocationResolver &resolver,
                    const core::SchedulerSettings &settings);

    PlacementResult place(const data::ErrandInstance &instance, const ScheduleState &state,
                          const FreeTimeLedger &ledger) const;

private:
    struct Target
    {
        bool remote = false;
        bool open = false;
        std::optional<data::GeoPoint> point;
        QString label;
    };

    struct Candidate
    {
        FreeInterval interval;
        QDateTime windowStart;
        QDateTime windowEnd;
    };

    struct Evaluation
    {
        std::optional<Placement> best;
        bool travelInfeasible = false;
        bool spacingBlocked = false;
    };

    std::optional<Target> resolveTarget(const data::ErrandDefinition &definition, const FreeTimeLedger &ledger) const;
    PlacementResult search(const data::ErrandInstance &instance, const Target &target, const ScheduleState &state,
                           const FreeTimeLedger &ledger, int minimumDuration) const;
    Evaluation evaluate(const data::ErrandInstance &instance, const Target &target, const Candidate &candidate,
                        const ScheduleState &state, int minimumDuration) const;
    std::optional<Placement> fit(const data::ErrandInstance &instance, const Candidate &candidate,
                                 const std::optional<data::GeoPoint> &point, const QString &label,
                                 const ScheduleState &state, int minimumDuration, Evaluation &evaluation) const;
    std::optional<std::vector<data::LocationCandidate>> queryLocations(const data::LocationSpec &spec,
                                                                       const data::GeoPoint &origin,
                                                                       int budgetMinutes) const;

    static bool isBetter(const Placement &candidate, const Placement &incumbent);

    const TravelEstimator &m_travel;
    const data::LocationResolver &m_resolver;
    core::SchedulerSettings m_settings;
};

} // namespace scheduling
} // namespace errandplan
