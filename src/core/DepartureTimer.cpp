#include "tetherlock/core/DepartureTimer.hpp"

namespace tetherlock::core
{

DepartureTimer::DepartureTimer(NowProvider nowProvider) : m_now(std::move(nowProvider))
{
}

void DepartureTimer::begin() noexcept
{
    m_startedAt = m_now();
}

void DepartureTimer::cancel() noexcept
{
    m_startedAt.reset();
}

bool DepartureTimer::isActive() const noexcept
{
    return m_startedAt.has_value();
}

std::optional<DepartureTimer::TimePoint> DepartureTimer::startedAt() const noexcept
{
    return m_startedAt;
}

DepartureTimer::Duration DepartureTimer::elapsed() const noexcept
{
    if (!m_startedAt)
    {
        return Duration::zero();
    }

    const auto delta{ m_now() - *m_startedAt };
    if (delta < Duration::zero())
    {
        return Duration::zero();
    }
    return delta;
}

bool DepartureTimer::hasElapsed(std::chrono::seconds timeout) const noexcept
{
    if (!m_startedAt)
    {
        return false;
    }

    return elapsed() >= timeout;
}

} // namespace tetherlock::core
