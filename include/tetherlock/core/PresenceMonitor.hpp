#ifndef INCLUDE_TETHERLOCK_CORE_PRESENCEMONITOR_HPP
#define INCLUDE_TETHERLOCK_CORE_PRESENCEMONITOR_HPP

#include "tetherlock/core/DepartureTimer.hpp"
#include "tetherlock/core/LockArbiter.hpp"
#include "tetherlock/core/MonitorEvent.hpp"
#include "tetherlock/core/MonitorSettings.hpp"
#include "tetherlock/core/PresenceStateMachine.hpp"
#include "tetherlock/core/ReconnectionAttempter.hpp"
#include "tetherlock/device/IDevicePresenceSource.hpp"
#include "tetherlock/device/TrackedDevice.hpp"
#include "tetherlock/session/ISessionLocker.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <vector>

namespace tetherlock::core
{

enum class TickStatus : std::uint8_t
{
    Detecting,   // discovery still running
    Idle,        // nothing discovered or nothing selected
    Evaluated,   // selected device probed and presence policy applied
    ProbeFailed, // selected device could not be probed; state left untouched
};

struct MonitorSnapshot final
{
    bool detecting{ false };
    std::vector<tetherlock::device::TrackedDevice> devices;
    std::optional<std::size_t> selected;
    PresenceState state{ PresenceState::None };
    bool canLock{ false };
    std::chrono::seconds confirmationTimeout{ g_defaultConfirmationTimeout };
    bool reconnectInFlight{ false };
};

// Drives one monitored device slot: probe refresh, presence policy, lock arbitration and reconnection.
// Not thread-safe; every member except the event sink runs in the context that calls tick().
class PresenceMonitor final
{
public:
    using NowProvider = DepartureTimer::NowProvider;

    PresenceMonitor(tetherlock::device::IDevicePresenceSource& source, tetherlock::session::ISessionLocker& locker,
                    NowProvider nowProvider = DepartureTimer::Clock::now);

    PresenceMonitor(const PresenceMonitor&) = delete;
    PresenceMonitor& operator=(const PresenceMonitor&) = delete;
    PresenceMonitor(PresenceMonitor&&) = delete;
    PresenceMonitor& operator=(PresenceMonitor&&) = delete;
    ~PresenceMonitor() = default;

    // Install before the first tick.
    void setEventSink(EventSink sink);

    // Launches discovery off the polling path; tick() reports Detecting until it completes.
    void startDiscovery();
    [[nodiscard]] bool discoveryPending() const noexcept;

    // Selected once discovery completes, if the address is among the results.
    void setPreferredDevice(tetherlock::device::DeviceHandle device);

    // Throws ProbeUnavailable when the radio stack is missing. Transient probe failures are reported, not thrown.
    TickStatus tick();

    // Both fire Close before switching so a pending departure never carries over to another device.
    bool select(const tetherlock::device::DeviceHandle& device);
    bool selectIndex(std::size_t index);
    void deselect();

    // Throws std::invalid_argument unless `timeout` is one of g_confirmationTimeoutChoices.
    void setConfirmationTimeout(std::chrono::seconds timeout);

    [[nodiscard]] PresenceState state() const noexcept;
    [[nodiscard]] bool canLock() const noexcept;
    [[nodiscard]] std::chrono::seconds confirmationTimeout() const noexcept;
    [[nodiscard]] const std::vector<tetherlock::device::TrackedDevice>& devices() const noexcept;
    [[nodiscard]] std::optional<std::size_t> selectedIndex() const noexcept;
    [[nodiscard]] const DepartureTimer& departureTimer() const noexcept;
    [[nodiscard]] bool reconnectInFlight() const noexcept;
    [[nodiscard]] MonitorSnapshot snapshot() const;

    // Blocks until an in-flight reconnection attempt has finished.
    void waitForReconnection();

private:
    struct MonitorSession final
    {
        std::vector<tetherlock::device::TrackedDevice> devices;
        std::optional<std::size_t> selected;
        PresenceStateMachine machine;
        DepartureTimer departure;
        LockArbiter arbiter;
        std::chrono::seconds confirmationTimeout{ g_defaultConfirmationTimeout };
    };

    void publish(MonitorEvent event) const;
    [[nodiscard]] bool finishDiscovery();
    [[nodiscard]] bool refreshDevices();
    void evaluate(bool connected);
    void fire(PresenceTrigger trigger);
    void onTransition(const Transition& transition);
    void close();
    [[nodiscard]] std::string selectedLabel() const;

    tetherlock::device::IDevicePresenceSource* m_source{ nullptr };
    EventSink m_sink;
    MonitorSession m_session;
    std::optional<tetherlock::device::DeviceHandle> m_preferred;
    std::future<std::vector<tetherlock::device::DeviceHandle>> m_discovery;
    ReconnectionAttempter m_reconnect;
};

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_PRESENCEMONITOR_HPP
