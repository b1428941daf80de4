#include "tetherlock/core/LockArbiter.hpp"
#include <exception>

namespace tetherlock::core
{

LockArbiter::LockArbiter(tetherlock::session::ISessionLocker& locker) noexcept : m_locker(&locker)
{
}

void LockArbiter::grant() noexcept
{
    m_canLock = true;
}

void LockArbiter::revoke() noexcept
{
    m_canLock = false;
}

bool LockArbiter::canLock() const noexcept
{
    return m_canLock;
}

LockDecision LockArbiter::maybeLock(PresenceState from, PresenceState to)
{
    if (!shouldLock(from, to, m_canLock))
    {
        return LockDecision::NotRequested;
    }

    m_canLock = false;
    try
    {
        m_locker->lockSession();
    }
    catch (const std::exception& e) // LockActionFailure and anything else the adapter lets through
    {
        m_lastFailure = e.what();
        return LockDecision::Failed;
    }

    m_lastFailure.clear();
    return LockDecision::Locked;
}

const std::string& LockArbiter::lastFailure() const noexcept
{
    return m_lastFailure;
}

} // namespace tetherlock::core
