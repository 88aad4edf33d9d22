#pragma once

#include <QString>
#include <QUuid>
#include <vector>

#include "errandplan/data/ErrandInstance.hpp"
#include "errandplan/scheduling/ScheduleState.hpp"

namespace errandplan {
namespace scheduling {

enum class BlockingReason
{
    None,
    TimeWindowConflict,
    AccessTypeInfeasible,
    IntervalSpacingConflict,
    SameDayConflict,
};

QString blockingReasonName(BlockingReason reason);

enum class IssueKind
{
    Validation,
    InvalidRecurrence,
};

struct DefinitionIssue
{
    QUuid definitionId;
    QString title;
    IssueKind kind = IssueKind::Validation;
    QString message;
};

struct UnschedulableInstance
{
    data::ErrandInstance instance;
    BlockingReason reason = BlockingReason::None;
};

struct SchedulingResult
{
    std::vector<data::ErrandInstance> placedInstances;
    std::vector<UnschedulableInstance> unschedulable;
    std::vector<DefinitionIssue> issues;
    ScheduleState state;
    bool cancelled = false;
};

} // namespace scheduling
} // namespace errandplan
