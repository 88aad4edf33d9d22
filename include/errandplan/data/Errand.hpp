#pragma once

#include <QDate>
#include <QList>
#include <QString>
#include <QUuid>
#include <optional>
#include <variant>

namespace errandplan {
namespace data {

enum class AccessType
{
    Drive,
    Bus,
    Train,
    AllTransit,
    Bike,
    Walk,
};

struct GeoPoint
{
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const GeoPoint &other) const
    {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const GeoPoint &other) const { return !(*this == other); }
};

// A fixed coordinate, e.g. the user's home or a known address.
struct ExactLocation
{
    GeoPoint point;
    QString label;
};

// A single named place. Resolved once through the LocationResolver when it
// carries no coordinate.
struct NamedPlace
{
    QString name;
    std::optional<GeoPoint> point;
};

// Any branch of a store category or chain ("pet store", "any Safeway").
struct StoreCategory
{
    QString category;
};

struct RemoteLocation
{
};

using LocationSpec = std::variant<ExactLocation, NamedPlace, StoreCategory, RemoteLocation>;

enum class RepeatKind
{
    None,
    Daily,
    EveryNDays,
    Weekly,
    WeeklyOnDays,
    Monthly,
    MonthlyOnDays,
    Yearly,
    YearlyOnDays,
};

struct RepetitionRule
{
    RepeatKind kind = RepeatKind::None;
    int every = 1;
    // Weekdays (1 = Monday) for WeeklyOnDays, days of month for
    // MonthlyOnDays, days of year for YearlyOnDays.
    QList<int> allowedDays;
    QDate anchor;
};

struct IntervalRange
{
    int targetDays = 0;
    int toleranceDays = 0;
    int minimumGapMinutes = 0;
};

struct TimeWindow
{
    int startMinute = 0;
    int endMinute = 24 * 60;

    int length() const { return endMinute - startMinute; }
};

struct ErrandDefinition
{
    QUuid id = QUuid::createUuid();
    QString title;
    LocationSpec location = RemoteLocation{};
    AccessType access = AccessType::Drive;
    int priority = 3;
    int durationMinutes = 0;
    int minimumDurationMinutes = 0;
    TimeWindow window;
    QDate date;
    RepetitionRule repetition;
    IntervalRange interval;
    QList<QUuid> conflictsWith;
};

bool isTransit(AccessType access);
bool isRemote(const LocationSpec &location);
bool isOpenLocation(const LocationSpec &location);
QString accessTypeName(AccessType access);
QString repeatKindName(RepeatKind kind);

} // namespace data
} // namespace errandplan
