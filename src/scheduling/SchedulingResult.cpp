#include "errandplan/scheduling/SchedulingResult.hpp"

namespace errandplan {
namespace scheduling {

QString blockingReasonName(BlockingReason reason)
{
    switch (reason) {
    case BlockingReason::None:
        return QStringLiteral("none");
    case BlockingReason::TimeWindowConflict:
        return QStringLiteral("time-window conflict");
    case BlockingReason::AccessTypeInfeasible:
        return QStringLiteral("access-type infeasibility");
    case BlockingReason::IntervalSpacingConflict:
        return QStringLiteral("interval-spacing conflict");
    case BlockingReason::SameDayConflict:
        return QStringLiteral("same-day conflict");
    }
    return QString();
}

} // namespace scheduling
} // namespace errandplan
