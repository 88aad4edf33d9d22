#pragma once

#include <atomic>

namespace errandplan {
namespace core {

// Set from any thread when the inputs of a running pass became stale.
class CancellationToken
{
public:
    void cancel();
    void reset();
    bool isCancelled() const;

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace core
} // namespace errandplan
