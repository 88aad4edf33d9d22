#pragma once

#include <QSet>
#include <QUuid>
#include <optional>
#include <vector>

#include "errandplan/data/ErrandInstance.hpp"
#include "errandplan/scheduling/FreeTimeLedger.hpp"
#include "errandplan/scheduling/ScheduleState.hpp"
#include "errandplan/scheduling/SchedulingResult.hpp"

namespace errandplan {
namespace core {
class CancellationToken;
}

namespace scheduling {

class PlacementSearch;
class ScheduleWriter;

struct CascadeResult
{
    bool placed = false;
    // The timeline after the whole chain; only meaningful when placed.
    ScheduleState state;
    FreeTimeLedger ledger;
    // Displaced instances in chain order.
    std::vector<QUuid> displaced;
    BlockingReason reason = BlockingReason::None;
};

// Makes room for an instance by moving already committed, not more important
// instances. All exploration happens on copies: the caller's state and ledger
// are never touched and a failed attempt leaves nothing behind.
class CascadeResolver
{
public:
    CascadeResolver(const PlacementSearch &search, const ScheduleWriter &writer);

    CascadeResult resolve(const data::ErrandInstance &instance, const ScheduleState &state,
                          const FreeTimeLedger &ledger, int depthBudget,
                          const core::CancellationToken *cancel = nullptr) const;

private:
    struct Branch
    {
        ScheduleState state;
        FreeTimeLedger ledger;
        std::vector<QUuid> displaced;
    };

    std::optional<Branch> tryChain(const data::ErrandInstance &instance, const ScheduleState &state,
                                   const FreeTimeLedger &ledger, int depth, const QSet<QUuid> &excluded,
                                   const core::CancellationToken *cancel) const;
    std::vector<const data::ErrandInstance *> blockersFor(const data::ErrandInstance &instance,
                                                          const ScheduleState &state,
                                                          const QSet<QUuid> &excluded) const;

    const PlacementSearch &m_search;
    const ScheduleWriter &m_writer;
};

} // namespace scheduling
} // namespace errandplan
