#include "errandplan/scheduling/TravelEstimator.hpp"

#include "errandplan/core/Logging.hpp"

#include <QMutexLocker>
#include <QThread>

namespace errandplan {
namespace scheduling {

TravelEstimator::TravelEstimator(const data::TravelTimeProvider &provider, const core::SchedulerSettings &settings)
    : m_provider(provider)
    , m_retries(settings.providerRetries)
    , m_backoffMs(settings.providerBackoffMs)
    , m_unknownOriginBufferMinutes(settings.unknownOriginBufferMinutes)
{
}

std::optional<data::TravelSegment> TravelEstimator::estimate(const data::GeoPoint &origin,
                                                             const data::GeoPoint &destination,
                                                             data::AccessType access,
                                                             const QDateTime &departure) const
{
    if (origin == destination) {
        return data::TravelSegment{0, access, 0};
    }

    const data::TravelQuery travelQuery{origin, destination, access, departure};
    const QString key = cacheKey(travelQuery);
    {
        QMutexLocker locker(&m_mutex);
        const auto it = m_cache.constFind(key);
        if (it != m_cache.constEnd()) {
            return it.value();
        }
    }

    // Concurrent misses on the same key may both query; the answers agree.
    const auto segment = query(travelQuery);
    QMutexLocker locker(&m_mutex);
    m_cache.insert(key, segment);
    return segment;
}

std::optional<data::TravelSegment> TravelEstimator::estimateFrom(const data::GeoPoint &origin, bool originKnown,
                                                                 const data::GeoPoint &destination,
                                                                 data::AccessType access,
                                                                 const QDateTime &departure) const
{
    if (!originKnown) {
        return data::TravelSegment{m_unknownOriginBufferMinutes, access, 0};
    }
    return estimate(origin, destination, access, departure);
}

int TravelEstimator::providerCalls() const
{
    return m_providerCalls.load();
}

QString TravelEstimator::cacheKey(const data::TravelQuery &query)
{
    return QStringLiteral("%1,%2>%3,%4/%5@%6")
        .arg(QString::number(query.origin.latitude, 'g', 12), QString::number(query.origin.longitude, 'g', 12),
             QString::number(query.destination.latitude, 'g', 12),
             QString::number(query.destination.longitude, 'g', 12), data::accessTypeName(query.access),
             query.departure.toString(Qt::ISODate));
}

std::optional<data::TravelSegment> TravelEstimator::query(const data::TravelQuery &query) const
{
    for (int attempt = 0; attempt <= m_retries; ++attempt) {
        if (attempt > 0 && m_backoffMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_backoffMs) << (attempt - 1));
        }
        ++m_providerCalls;
        QString error;
        const auto estimate = m_provider.estimate(query, &error);
        if (!estimate) {
            qCWarning(lcTravel) << "Travel provider failed, attempt" << attempt + 1 << "of" << m_retries + 1
                                << ":" << error;
            continue;
        }
        if (!estimate->feasible || estimate->durationMinutes < 0) {
            qCDebug(lcTravel) << "No" << data::accessTypeName(query.access) << "route for"
                              << query.departure.toString(Qt::ISODate);
            return std::nullopt;
        }
        return data::TravelSegment{estimate->durationMinutes, query.access, estimate->transfers};
    }
    qCWarning(lcTravel) << "Treating" << data::accessTypeName(query.access)
                        << "leg as infeasible after repeated provider failures";
    return std::nullopt;
}

} // namespace scheduling
} // namespace errandplan
