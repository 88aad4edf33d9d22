#pragma once

#include <QUuid>
#include <optional>

#include "errandplan/data/ErrandInstance.hpp"

namespace errandplan {
namespace scheduling {

class FreeTimeLedger;
class ScheduleState;
class TravelEstimator;
struct Placement;

// The only code path that mutates a ScheduleState together with its ledger.
// Keeps the reservation, the timeline entry and the travel segment of the
// following item consistent.
class ScheduleWriter
{
public:
    explicit ScheduleWriter(const TravelEstimator &travel);

    bool commit(ScheduleState &state, FreeTimeLedger &ledger, data::ErrandInstance instance,
                const Placement &placement) const;
    std::optional<data::ErrandInstance> displace(ScheduleState &state, FreeTimeLedger &ledger,
                                                 const QUuid &instanceId) const;
    // Reserves an instance that already carries its start, end and location
    // and recomputes its own travel segment against the current calendar.
    bool adopt(ScheduleState &state, FreeTimeLedger &ledger, const data::ErrandInstance &instance) const;

private:
    bool insert(ScheduleState &state, FreeTimeLedger &ledger, const data::ErrandInstance &instance) const;
    void refreshFollower(ScheduleState &state, const FreeTimeLedger &ledger, const QDateTime &after) const;
    std::optional<data::TravelSegment> travelInFor(const FreeTimeLedger &ledger,
                                                   const data::ErrandInstance &instance) const;

    const TravelEstimator &m_travel;
};

} // namespace scheduling
} // namespace errandplan
