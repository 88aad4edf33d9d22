#pragma once

#include <QSharedDataPointer>
#include <QString>
#include <QUuid>
#include <optional>
#include <vector>

#include "errandplan/data/ErrandInstance.hpp"

namespace errandplan {
namespace scheduling {

class ScheduleStateData;

// The committed timeline. Copies share storage until one side is modified,
// so a copy is a snapshot and assigning it back is a full rollback.
class ScheduleState
{
public:
    ScheduleState();
    ScheduleState(const ScheduleState &other);
    ScheduleState(ScheduleState &&other) noexcept;
    ScheduleState &operator=(const ScheduleState &other);
    ScheduleState &operator=(ScheduleState &&other) noexcept;
    ~ScheduleState();

    bool place(data::ErrandInstance instance);
    std::optional<data::ErrandInstance> remove(const QUuid &instanceId);
    bool setTravelIn(const QUuid &instanceId, const data::TravelSegment &segment);
    bool setPinned(const QUuid &instanceId, bool pinned);

    bool contains(const QUuid &instanceId) const;
    const data::ErrandInstance *find(const QUuid &instanceId) const;
    const data::ErrandInstance *firstStartingAtOrAfter(const QDateTime &time) const;

    // Ordered by start time.
    std::vector<data::ErrandInstance> instances() const;
    std::vector<const data::ErrandInstance *> instancesOf(const QUuid &definitionId) const;
    std::vector<const data::ErrandInstance *> overlapping(const QDateTime &from, const QDateTime &to) const;

    int size() const;
    bool isEmpty() const;

    // Points every instance at the definition with the same id and drops
    // instances whose definition is gone. Returns the number dropped.
    int rebind(const std::vector<data::ErrandDefinition> &definitions);

    // Checks travel feasibility between consecutive items, window
    // containment and minimum spacing.
    bool verify(QString *error = nullptr) const;

    bool operator==(const ScheduleState &other) const;
    bool operator!=(const ScheduleState &other) const { return !(*this == other); }

private:
    QSharedDataPointer<ScheduleStateData> d;
};

} // namespace scheduling
} // namespace errandplan
