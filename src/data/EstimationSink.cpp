#include "errandplan/data/EstimationSink.hpp"

namespace errandplan {
namespace data {

void InMemoryEstimationLog::record(const ActualTimeReport &report)
{
    m_reports.push_back(report);
}

const std::vector<ActualTimeReport> &InMemoryEstimationLog::reports() const
{
    return m_reports;
}

std::vector<ActualTimeReport> InMemoryEstimationLog::reportsFor(const QUuid &definitionId) const
{
    std::vector<ActualTimeReport> matching;
    for (const auto &report : m_reports) {
        if (report.definitionId == definitionId) {
            matching.push_back(report);
        }
    }
    return matching;
}

} // namespace data
} // namespace errandplan
