#include "errandplan/core/CancellationToken.hpp"

namespace errandplan {
namespace core {

void CancellationToken::cancel()
{
    m_cancelled.store(true, std::memory_order_release);
}

void CancellationToken::reset()
{
    m_cancelled.store(false, std::memory_order_release);
}

bool CancellationToken::isCancelled() const
{
    return m_cancelled.load(std::memory_order_acquire);
}

} // namespace core
} // namespace errandplan
