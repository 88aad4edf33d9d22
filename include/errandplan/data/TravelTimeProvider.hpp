#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "errandplan/data/Errand.hpp"

namespace errandplan {
namespace data {

struct TravelQuery
{
    GeoPoint origin;
    GeoPoint destination;
    AccessType access = AccessType::Drive;
    QDateTime departure;
};

struct TravelEstimate
{
    int durationMinutes = 0;
    bool feasible = true;
    int transfers = 0;
};

// Returns std::nullopt on a provider failure (network, quota, parse error)
// and fills *error when given. An unreachable destination is a successful
// answer with feasible == false. May be called from several threads at once.
class TravelTimeProvider
{
public:
    virtual ~TravelTimeProvider() = default;

    virtual std::optional<TravelEstimate> estimate(const TravelQuery &query, QString *error) const = 0;
};

} // namespace data
} // namespace errandplan
