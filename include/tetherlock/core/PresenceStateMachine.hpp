#ifndef INCLUDE_TETHERLOCK_CORE_PRESENCESTATEMACHINE_HPP
#define INCLUDE_TETHERLOCK_CORE_PRESENCESTATEMACHINE_HPP

#include "tetherlock/core/PresenceState.hpp"

namespace tetherlock::core
{

struct Transition final
{
    PresenceTrigger trigger{ PresenceTrigger::Close };
    PresenceState from{ PresenceState::None };
    PresenceState to{ PresenceState::None };

    [[nodiscard]] constexpr bool changed() const noexcept
    {
        return from != to;
    }
};

// Not thread-safe: owned and fired by a single scheduler context.
class PresenceStateMachine final
{
public:
    explicit PresenceStateMachine(PresenceState initial = PresenceState::None) noexcept;

    // Throws InvalidTransition when `trigger` is not permitted in the current state; the state is left as is.
    Transition fire(PresenceTrigger trigger);

    [[nodiscard]] PresenceState state() const noexcept;

private:
    PresenceState m_state{ PresenceState::None };
};

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_PRESENCESTATEMACHINE_HPP
