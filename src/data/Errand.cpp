#include "errandplan/data/Errand.hpp"

#include "errandplan/data/ErrandInstance.hpp"

namespace errandplan {
namespace data {

bool isTransit(AccessType access)
{
    switch (access) {
    case AccessType::Bus:
    case AccessType::Train:
    case AccessType::AllTransit:
        return true;
    case AccessType::Drive:
    case AccessType::Bike:
    case AccessType::Walk:
        return false;
    }
    return false;
}

bool isRemote(const LocationSpec &location)
{
    return std::holds_alternative<RemoteLocation>(location);
}

bool isOpenLocation(const LocationSpec &location)
{
    return std::holds_alternative<StoreCategory>(location);
}

QString accessTypeName(AccessType access)
{
    switch (access) {
    case AccessType::Drive:
        return QStringLiteral("drive");
    case AccessType::Bus:
        return QStringLiteral("bus");
    case AccessType::Train:
        return QStringLiteral("train");
    case AccessType::AllTransit:
        return QStringLiteral("all-transit");
    case AccessType::Bike:
        return QStringLiteral("bike");
    case AccessType::Walk:
        return QStringLiteral("walk");
    }
    return QString();
}

QString repeatKindName(RepeatKind kind)
{
    switch (kind) {
    case RepeatKind::None:
        return QStringLiteral("none");
    case RepeatKind::Daily:
        return QStringLiteral("daily");
    case RepeatKind::EveryNDays:
        return QStringLiteral("every-n-days");
    case RepeatKind::Weekly:
        return QStringLiteral("weekly");
    case RepeatKind::WeeklyOnDays:
        return QStringLiteral("weekly-on-days");
    case RepeatKind::Monthly:
        return QStringLiteral("monthly");
    case RepeatKind::MonthlyOnDays:
        return QStringLiteral("monthly-on-days");
    case RepeatKind::Yearly:
        return QStringLiteral("yearly");
    case RepeatKind::YearlyOnDays:
        return QStringLiteral("yearly-on-days");
    }
    return QString();
}

QUuid ErrandInstance::definitionId() const
{
    return definition ? definition->id : QUuid();
}

int ErrandInstance::priority() const
{
    return definition ? definition->priority : 0;
}

int ErrandInstance::durationMinutes() const
{
    if (start.isValid() && end.isValid()) {
        return static_cast<int>(start.secsTo(end) / 60);
    }
    return definition ? definition->durationMinutes : 0;
}

QUuid instanceIdFor(const QUuid &definitionId, const QDate &date)
{
    return QUuid::createUuidV5(definitionId, date.toString(Qt::ISODate));
}

ErrandInstance makeInstance(const ErrandDefinition &definition, const QDate &targetDate,
                            const QDate &earliestDate, const QDate &latestDate)
{
    ErrandInstance instance;
    instance.id = instanceIdFor(definition.id, targetDate);
    instance.definition = &definition;
    instance.targetDate = targetDate;
    instance.earliestDate = earliestDate;
    instance.latestDate = latestDate;
    return instance;
}

} // namespace data
} // namespace errandplan
