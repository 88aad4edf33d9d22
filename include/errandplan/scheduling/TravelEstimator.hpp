#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <atomic>
#include <optional>

#include "errandplan/core/SchedulerSettings.hpp"
#include "errandplan/data/ErrandInstance.hpp"
#include "errandplan/data/TravelTimeProvider.hpp"

namespace errandplan {
namespace scheduling {

// Thread-safe front for a TravelTimeProvider. Failed provider calls are
// retried with a growing delay; an estimate that stays unavailable is
// reported as infeasible (std::nullopt) instead of failing the pass.
class TravelEstimator
{
public:
    TravelEstimator(const data::TravelTimeProvider &provider, const core::SchedulerSettings &settings);

    std::optional<data::TravelSegment> estimate(const data::GeoPoint &origin, const data::GeoPoint &destination,
                                                data::AccessType access, const QDateTime &departure) const;
    // Travel from a place the user may not actually be at. An unknown origin
    // costs the configured buffer instead of a route.
    std::optional<data::TravelSegment> estimateFrom(const data::GeoPoint &origin, bool originKnown,
                                                    const data::GeoPoint &destination, data::AccessType access,
                                                    const QDateTime &departure) const;

    int providerCalls() const;

private:
    static QString cacheKey(const data::TravelQuery &query);
    std::optional<data::TravelSegment> query(const data::TravelQuery &query) const;

    const data::TravelTimeProvider &m_provider;
    int m_retries = 0;
    int m_backoffMs = 0;
    int m_unknownOriginBufferMinutes = 0;
    mutable QMutex m_mutex;
    mutable QHash<QString, std::optional<data::TravelSegment>> m_cache;
    mutable std::atomic<int> m_providerCalls{0};
};

} // namespace scheduling
} // namespace errandplan
