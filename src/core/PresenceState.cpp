#include "tetherlock/core/PresenceState.hpp"

namespace tetherlock::core
{

std::string_view toString(PresenceState state) noexcept
{
    switch (state)
    {
    case PresenceState::None:
        return "None";
    case PresenceState::Connected:
        return "Connected";
    case PresenceState::WaitingConfirmDisconnect:
        return "WaitingConfirmDisconnect";
    case PresenceState::Disconnected:
        return "Disconnected";
    }
    return "Unknown";
}

std::string_view toString(PresenceTrigger trigger) noexcept
{
    switch (trigger)
    {
    case PresenceTrigger::Connected:
        return "Connected";
    case PresenceTrigger::WaitingConfirmDisconnect:
        return "WaitingConfirmDisconnect";
    case PresenceTrigger::Disconnected:
        return "Disconnected";
    case PresenceTrigger::Close:
        return "Close";
    }
    return "Unknown";
}

} // namespace tetherlock::core
