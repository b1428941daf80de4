#ifndef INCLUDE_TETHERLOCK_CORE_MONITOREVENT_HPP
#define INCLUDE_TETHERLOCK_CORE_MONITOREVENT_HPP

#include "tetherlock/core/PresenceState.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace tetherlock::core
{

enum class MonitorEventKind : std::uint8_t
{
    DiscoveryStarted,
    DiscoveryFinished,
    NoDevicesFound,
    DiscoveryFailed,
    DeviceSelected,
    DeviceDeselected,
    PreferredDeviceMissing,
    StateChanged,
    SessionLocked,
    LockFailed,
    ProbeFailed,
    ReconnectStarted,
    ReconnectSucceeded,
    ReconnectFailed,
    TimeoutChanged,
};

enum class EventSeverity : std::uint8_t
{
    Debug,
    Info,
    Warning,
    Critical,
};

struct MonitorEvent final
{
    MonitorEventKind kind{ MonitorEventKind::StateChanged };
    std::string device;
    PresenceState from{ PresenceState::None };
    PresenceState to{ PresenceState::None };
    std::string detail;
};

// Must tolerate calls from the reconnection worker thread as well as from the scheduler.
using EventSink = std::function<void(const MonitorEvent&)>;

[[nodiscard]] EventSeverity severityOf(MonitorEventKind kind) noexcept;

// One human-readable line, e.g. "Device disconnected. Waiting for confirmation..."
[[nodiscard]] std::string describe(const MonitorEvent& event);

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_MONITOREVENT_HPP
