#include "tetherlock/core/PresenceStateMachine.hpp"
#include <string>

namespace tetherlock::core
{

PresenceStateMachine::PresenceStateMachine(PresenceState initial) noexcept : m_state(initial)
{
}

Transition PresenceStateMachine::fire(PresenceTrigger trigger)
{
    const auto next{ nextState(m_state, trigger) };
    if (!next)
    {
        std::string what{ "trigger " };
        what += toString(trigger);
        what += " is not permitted in state ";
        what += toString(m_state);
        throw InvalidTransition{ what };
    }

    const Transition transition{ trigger, m_state, *next };
    m_state = *next;
    return transition;
}

PresenceState PresenceStateMachine::state() const noexcept
{
    return m_state;
}

} // namespace tetherlock::core
