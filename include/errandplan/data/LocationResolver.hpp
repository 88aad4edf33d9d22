#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "errandplan/data/Errand.hpp"

namespace errandplan {
namespace data {

struct LocationCandidate
{
    GeoPoint point;
    QString label;
    int travelHintMinutes = 0;
};

class LocationResolver
{
public:
    virtual ~LocationResolver() = default;

    // Candidates are ordered nearest first. std::nullopt signals a provider
    // failure; an empty vector means nothing matches within the budget.
    // May be called from several threads at once.
    virtual std::optional<std::vector<LocationCandidate>> candidates(const LocationSpec &spec,
                                                                     const GeoPoint &origin,
                                                                     int radiusBudgetMinutes,
                                                                     QString *error) const = 0;
};

} // namespace data
} // namespace errandplan
