#ifndef INCLUDE_TETHERLOCK_CORE_LOCKARBITER_HPP
#define INCLUDE_TETHERLOCK_CORE_LOCKARBITER_HPP

#include "tetherlock/core/PresenceState.hpp"
#include "tetherlock/session/ISessionLocker.hpp"
#include <cstdint>
#include <string>

namespace tetherlock::core
{

enum class LockDecision : std::uint8_t
{
    NotRequested,
    Locked,
    Failed,
};

// A lock is due only on the confirmed path WaitingConfirmDisconnect -> Disconnected while permitted.
[[nodiscard]] constexpr bool shouldLock(PresenceState from, PresenceState to, bool canLock) noexcept
{
    return canLock && from == PresenceState::WaitingConfirmDisconnect && to == PresenceState::Disconnected;
}

// Owns the lock permission and is the only caller of ISessionLocker::lockSession().
class LockArbiter final
{
public:
    explicit LockArbiter(tetherlock::session::ISessionLocker& locker) noexcept;

    // Called when the device is observed present.
    void grant() noexcept;
    void revoke() noexcept;
    [[nodiscard]] bool canLock() const noexcept;

    // Fires the lock at most once per grant. The permission is consumed even when the OS call fails.
    LockDecision maybeLock(PresenceState from, PresenceState to);

    // Reason of the last failed lock attempt; empty if none failed.
    [[nodiscard]] const std::string& lastFailure() const noexcept;

private:
    tetherlock::session::ISessionLocker* m_locker{ nullptr };
    bool m_canLock{ false };
    std::string m_lastFailure;
};

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_LOCKARBITER_HPP
