#pragma once

#include <QUuid>
#include <vector>

namespace errandplan {
namespace data {

enum class ActualTimeField
{
    Duration,
    TravelTime,
};

struct ActualTimeReport
{
    QUuid instanceId;
    QUuid definitionId;
    ActualTimeField field = ActualTimeField::Duration;
    int minutes = 0;
};

// Receives actual durations and travel times reported after an errand was
// done. Implementations adjust future estimates; past schedules stay as they are.
class EstimationSink
{
public:
    virtual ~EstimationSink() = default;

    virtual void record(const ActualTimeReport &report) = 0;
};

class InMemoryEstimationLog : public EstimationSink
{
public:
    void record(const ActualTimeReport &report) override;

    const std::vector<ActualTimeReport> &reports() const;
    std::vector<ActualTimeReport> reportsFor(const QUuid &definitionId) const;

private:
    std::vector<ActualTimeReport> m_reports;
};

} // namespace data
} // namespace errandplan
