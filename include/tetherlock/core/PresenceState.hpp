#ifndef INCLUDE_TETHERLOCK_CORE_PRESENCESTATE_HPP
#define INCLUDE_TETHERLOCK_CORE_PRESENCESTATE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace tetherlock::core
{

enum class PresenceState : std::uint8_t
{
    None,
    Connected,
    WaitingConfirmDisconnect,
    Disconnected,
};

enum class PresenceTrigger : std::uint8_t
{
    Connected,
    WaitingConfirmDisconnect,
    Disconnected,
    Close,
};

inline constexpr std::array<PresenceState, 4> g_allPresenceStates{
    PresenceState::None,
    PresenceState::Connected,
    PresenceState::WaitingConfirmDisconnect,
    PresenceState::Disconnected,
};

inline constexpr std::array<PresenceTrigger, 4> g_allPresenceTriggers{
    PresenceTrigger::Connected,
    PresenceTrigger::WaitingConfirmDisconnect,
    PresenceTrigger::Disconnected,
    PresenceTrigger::Close,
};

class InvalidTransition final : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// Transition table. Ignored triggers map a state onto itself; std::nullopt marks a trigger
// that is not permitted in `from` at all.
[[nodiscard]] constexpr std::optional<PresenceState> nextState(PresenceState from, PresenceTrigger trigger) noexcept
{
    switch (from)
    {
    case PresenceState::None:
        switch (trigger)
        {
        case PresenceTrigger::Connected:
            return PresenceState::Connected;
        case PresenceTrigger::WaitingConfirmDisconnect:
        case PresenceTrigger::Disconnected:
            return PresenceState::Disconnected;
        case PresenceTrigger::Close:
            return PresenceState::None;
        }
        break;

    case PresenceState::Connected:
        switch (trigger)
        {
        case PresenceTrigger::Connected:
            return PresenceState::Connected;
        case PresenceTrigger::WaitingConfirmDisconnect:
            return PresenceState::WaitingConfirmDisconnect;
        case PresenceTrigger::Disconnected:
            return PresenceState::Disconnected;
        case PresenceTrigger::Close:
            return PresenceState::None;
        }
        break;

    case PresenceState::WaitingConfirmDisconnect:
        switch (trigger)
        {
        case PresenceTrigger::Connected:
            return PresenceState::Connected;
        case PresenceTrigger::WaitingConfirmDisconnect:
            return PresenceState::WaitingConfirmDisconnect;
        case PresenceTrigger::Disconnected:
            return PresenceState::Disconnected;
        case PresenceTrigger::Close:
            return PresenceState::None;
        }
        break;

    case PresenceState::Disconnected:
        switch (trigger)
        {
        case PresenceTrigger::Connected:
            return PresenceState::Connected;
        case PresenceTrigger::WaitingConfirmDisconnect:
            return std::nullopt;
        case PresenceTrigger::Disconnected:
            return PresenceState::Disconnected;
        case PresenceTrigger::Close:
            return PresenceState::None;
        }
        break;
    }

    return std::nullopt;
}

[[nodiscard]] constexpr bool isPermitted(PresenceState from, PresenceTrigger trigger) noexcept
{
    return nextState(from, trigger).has_value();
}

[[nodiscard]] std::string_view toString(PresenceState state) noexcept;
[[nodiscard]] std::string_view toString(PresenceTrigger trigger) noexcept;

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_PRESENCESTATE_HPP
