#include "errandplan/scheduling/ScheduleState.hpp"

#include <QHash>
#include <QSharedData>
#include <algorithm>

namespace errandplan {
namespace scheduling {

class ScheduleStateData : public QSharedData
{
public:
    // Arena of instances; removed slots are recycled. `order` holds handles
    // into the arena sorted by (start, id).
    std::vector<std::optional<data::ErrandInstance>> arena;
    std::vector<std::size_t> order;
    std::vector<std::size_t> freeSlots;
    QHash<QUuid, std::size_t> index;

    const data::ErrandInstance &at(std::size_t handle) const { return *arena[handle]; }
    data::ErrandInstance &at(std::size_t handle) { return *arena[handle]; }
};

namespace {
bool startsBefore(const data::ErrandInstance &a, const data::ErrandInstance &b)
{
    if (a.start != b.start) {
        return a.start < b.start;
    }
    return a.id < b.id;
}

bool sameTimeline(const data::ErrandInstance &a, const data::ErrandInstance &b)
{
    return a.id == b.id && a.definitionId() == b.definitionId() && a.targetDate == b.targetDate
        && a.start == b.start && a.end == b.end && a.location == b.location
        && a.locationLabel == b.locationLabel && a.travelIn == b.travelIn && a.status == b.status
        && a.pinned == b.pinned;
}
} // namespace

ScheduleState::ScheduleState()
    : d(new ScheduleStateData)
{
}

ScheduleState::ScheduleState(const ScheduleState &other) = default;
ScheduleState::ScheduleState(ScheduleState &&other) noexcept = default;
ScheduleState &ScheduleState::operator=(const ScheduleState &other) = default;
ScheduleState &ScheduleState::operator=(ScheduleState &&other) noexcept = default;
ScheduleState::~ScheduleState() = default;

bool ScheduleState::place(data::ErrandInstance instance)
{
    if (instance.id.isNull() || !instance.start.isValid() || !instance.end.isValid()
        || instance.end < instance.start || d->index.contains(instance.id)) {
        return false;
    }
    instance.status = data::InstanceStatus::Placed;

    std::size_t handle = 0;
    if (!d->freeSlots.empty()) {
        handle = d->freeSlots.back();
        d->freeSlots.pop_back();
        d->arena[handle] = std::move(instance);
    } else {
        handle = d->arena.size();
        d->arena.push_back(std::move(instance));
    }
    d->index.insert(d->at(handle).id, handle);

    const auto *data = d.constData();
    const auto pos = std::lower_bound(d->order.begin(), d->order.end(), handle,
                                      [data](std::size_t lhs, std::size_t rhs) {
                                          return startsBefore(data->at(lhs), data->at(rhs));
                                      });
    d->order.insert(pos, handle);
    return true;
}

std::optional<data::ErrandInstance> ScheduleState::remove(const QUuid &instanceId)
{
    if (!d->index.contains(instanceId)) {
        return std::nullopt;
    }
    const std::size_t handle = d->index.take(instanceId);
    d->order.erase(std::find(d->order.begin(), d->order.end(), handle));
    std::optional<data::ErrandInstance> removed = std::move(d->arena[handle]);
    d->arena[handle].reset();
    d->freeSlots.push_back(handle);
    return removed;
}

bool ScheduleState::setTravelIn(const QUuid &instanceId, const data::TravelSegment &segment)
{
    if (!contains(instanceId)) {
        return false;
    }
    d->at(d->index.value(instanceId)).travelIn = segment;
    return true;
}

bool ScheduleState::setPinned(const QUuid &instanceId, bool pinned)
{
    if (!contains(instanceId)) {
        return false;
    }
    d->at(d->index.value(instanceId)).pinned = pinned;
    return true;
}

bool ScheduleState::contains(const QUuid &instanceId) const
{
    return d->index.contains(instanceId);
}

const data::ErrandInstance *ScheduleState::find(const QUuid &instanceId) const
{
    const auto it = d->index.constFind(instanceId);
    if (it == d->index.constEnd()) {
        return nullptr;
    }
    return &d->at(it.value());
}

const data::ErrandInstance *ScheduleState::firstStartingAtOrAfter(const QDateTime &time) const
{
    for (std::size_t handle : d->order) {
        const auto &instance = d->at(handle);
        if (instance.start >= time) {
            return &instance;
        }
    }
    return nullptr;
}

std::vector<data::ErrandInstance> ScheduleState::instances() const
{
    std::vector<data::ErrandInstance> result;
    result.reserve(d->order.size());
    for (std::size_t handle : d->order) {
        result.push_back(d->at(handle));
    }
    return result;
}

std::vector<const data::ErrandInstance *> ScheduleState::instancesOf(const QUuid &definitionId) const
{
    std::vector<const data::ErrandInstance *> result;
    for (std::size_t handle : d->order) {
        const auto &instance = d->at(handle);
        if (instance.definitionId() == definitionId) {
            result.push_back(&instance);
        }
    }
    return result;
}

std::vector<const data::ErrandInstance *> ScheduleState::overlapping(const QDateTime &from, const QDateTime &to) const
{
    std::vector<const data::ErrandInstance *> result;
    for (std::size_t handle : d->order) {
        const auto &instance = d->at(handle);
        const QDateTime occupiedFrom = instance.start.addSecs(-60 * instance.travelIn.durationMinutes);
        if (occupiedFrom < to && instance.end > from) {
            result.push_back(&instance);
        }
    }
    return result;
}

int ScheduleState::size() const
{
    return static_cast<int>(d->order.size());
}

bool ScheduleState::isEmpty() const
{
    return d->order.empty();
}

int ScheduleState::rebind(const std::vector<data::ErrandDefinition> &definitions)
{
    QHash<QUuid, const data::ErrandDefinition *> byId;
    for (const auto &definition : definitions) {
        byId.insert(definition.id, &definition);
    }

    std::vector<QUuid> orphans;
    for (std::size_t handle : d->order) {
        const auto &instance = d->at(handle);
        if (!byId.contains(instance.definitionId())) {
            orphans.push_back(instance.id);
        }
    }
    for (const auto &id : orphans) {
        remove(id);
    }
    for (std::size_t handle : d->order) {
        auto &instance = d->at(handle);
        instance.definition = byId.value(instance.definitionId());
    }
    return static_cast<int>(orphans.size());
}

bool ScheduleState::verify(QString *error) const
{
    auto fail = [error](const QString &message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    const data::ErrandInstance *previous = nullptr;
    for (std::size_t handle : d->order) {
        const auto &instance = d->at(handle);
        const auto *definition = instance.definition;
        if (!definition) {
            return fail(QStringLiteral("Instance %1 has no definition").arg(instance.id.toString()));
        }

        if (previous && previous->start.date() == instance.start.date()) {
            const QDateTime earliest = previous->end.addSecs(60 * instance.travelIn.durationMinutes);
            if (earliest > instance.start) {
                return fail(QStringLiteral("'%1' starts at %2 before '%3' ends plus travel")
                                .arg(definition->title, instance.start.toString(Qt::ISODate),
                                     previous->definition ? previous->definition->title : QString()));
            }
        }

        const QDate day = instance.start.date();
        const QDateTime windowStart(day, QTime(0, 0));
        if (day < instance.earliestDate || day > instance.latestDate
            || instance.start < windowStart.addSecs(60 * definition->window.startMinute)
            || instance.end > windowStart.addSecs(60 * definition->window.endMinute)) {
            return fail(QStringLiteral("'%1' at %2 lies outside its valid window")
                            .arg(definition->title, instance.start.toString(Qt::ISODate)));
        }
        previous = &instance;
    }

    for (std::size_t handle : d->order) {
        const auto &instance = d->at(handle);
        const qint64 gap = 60LL * instance.definition->interval.minimumGapMinutes;
        if (gap <= 0) {
            continue;
        }
        for (const auto *sibling : instancesOf(instance.definitionId())) {
            if (sibling->id == instance.id) {
                continue;
            }
            if (qAbs(sibling->start.secsTo(instance.start)) < gap) {
                return fail(QStringLiteral("'%1' instances at %2 and %3 are closer than the minimum interval")
                                .arg(instance.definition->title, instance.start.toString(Qt::ISODate),
                                     sibling->start.toString(Qt::ISODate)));
            }
        }
    }
    return true;
}

bool ScheduleState::operator==(const ScheduleState &other) const
{
    if (d == other.d) {
        return true;
    }
    if (d->order.size() != other.d->order.size()) {
        return false;
    }
    for (std::size_t i = 0; i < d->order.size(); ++i) {
        if (!sameTimeline(d->at(d->order[i]), other.d->at(other.d->order[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace scheduling
} // namespace errandplan
