#include "tetherlock/core/PresenceMonitor.hpp"
#include "tetherlock/device/DeviceErrors.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace tetherlock::core
{
namespace
{

[[nodiscard]] std::string labelOf(const tetherlock::device::TrackedDevice& device)
{
    if (device.displayName.empty())
    {
        return device.handle.address;
    }
    return device.displayName + " [" + device.handle.address + "]";
}

} // namespace

PresenceMonitor::PresenceMonitor(tetherlock::device::IDevicePresenceSource& source,
                                 tetherlock::session::ISessionLocker& locker, NowProvider nowProvider)
    : m_source(&source),
      m_session{ {}, std::nullopt, PresenceStateMachine{}, DepartureTimer{ std::move(nowProvider) },
                 LockArbiter{ locker }, g_defaultConfirmationTimeout },
      m_reconnect(source,
                  [this](const tetherlock::device::DeviceHandle& device, ReconnectOutcome outcome,
                         const std::string& detail)
                  {
                      MonitorEvent event{};
                      event.kind = (outcome == ReconnectOutcome::Succeeded) ? MonitorEventKind::ReconnectSucceeded
                                                                             : MonitorEventKind::ReconnectFailed;
                      event.device = device.address;
                      event.detail = detail;
                      publish(std::move(event));
                  })
{
}

void PresenceMonitor::setEventSink(EventSink sink)
{
    m_sink = std::move(sink);
}

void PresenceMonitor::startDiscovery()
{
    if (m_discovery.valid())
    {
        return;
    }

    publish(MonitorEvent{ MonitorEventKind::DiscoveryStarted, {}, {}, {}, {} });
    auto* source{ m_source };
    m_discovery = std::async(std::launch::async, [source]() { return source->discover(); });
}

bool PresenceMonitor::discoveryPending() const noexcept
{
    return m_discovery.valid();
}

void PresenceMonitor::setPreferredDevice(tetherlock::device::DeviceHandle device)
{
    m_preferred = std::move(device);
}

TickStatus PresenceMonitor::tick()
{
    if (m_discovery.valid())
    {
        if (m_discovery.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready)
        {
            return TickStatus::Detecting;
        }
        if (!finishDiscovery())
        {
            return TickStatus::Detecting;
        }
    }

    if (m_session.devices.empty())
    {
        return TickStatus::Idle;
    }

    const bool selectedProbed{ refreshDevices() };
    if (!m_session.selected)
    {
        return TickStatus::Idle;
    }
    if (!selectedProbed)
    {
        return TickStatus::ProbeFailed;
    }

    const auto& device{ m_session.devices[*m_session.selected] };
    evaluate(device.connected);

    if (!device.connected && m_reconnect.tryLaunch(device.handle))
    {
        publish(MonitorEvent{ MonitorEventKind::ReconnectStarted, device.handle.address, {}, {}, {} });
    }

    return TickStatus::Evaluated;
}

bool PresenceMonitor::select(const tetherlock::device::DeviceHandle& device)
{
    const auto& devices{ m_session.devices };
    const auto it{ std::find_if(devices.begin(), devices.end(),
                                [&device](const tetherlock::device::TrackedDevice& d) { return d.handle == device; }) };
    if (it == devices.end())
    {
        return false;
    }

    return selectIndex(static_cast<std::size_t>(std::distance(devices.begin(), it)));
}

bool PresenceMonitor::selectIndex(std::size_t index)
{
    if (index >= m_session.devices.size())
    {
        return false;
    }
    if (m_session.selected == index)
    {
        return true;
    }

    close();
    m_session.selected = index;
    publish(MonitorEvent{ MonitorEventKind::DeviceSelected, selectedLabel(), {}, {}, {} });
    return true;
}

void PresenceMonitor::deselect()
{
    if (!m_session.selected)
    {
        return;
    }

    close();
    m_session.selected.reset();
    publish(MonitorEvent{ MonitorEventKind::DeviceDeselected, {}, {}, {}, {} });
}

void PresenceMonitor::setConfirmationTimeout(std::chrono::seconds timeout)
{
    if (!isSupportedConfirmationTimeout(timeout))
    {
        throw std::invalid_argument("setConfirmationTimeout: unsupported timeout");
    }
    if (m_session.confirmationTimeout == timeout)
    {
        return;
    }

    m_session.confirmationTimeout = timeout;
    publish(MonitorEvent{ MonitorEventKind::TimeoutChanged, {}, {}, {}, std::to_string(timeout.count()) + " s" });
}

PresenceState PresenceMonitor::state() const noexcept
{
    return m_session.machine.state();
}

bool PresenceMonitor::canLock() const noexcept
{
    return m_session.arbiter.canLock();
}

std::chrono::seconds PresenceMonitor::confirmationTimeout() const noexcept
{
    return m_session.confirmationTimeout;
}

const std::vector<tetherlock::device::TrackedDevice>& PresenceMonitor::devices() const noexcept
{
    return m_session.devices;
}

std::optional<std::size_t> PresenceMonitor::selectedIndex() const noexcept
{
    return m_session.selected;
}

const DepartureTimer& PresenceMonitor::departureTimer() const noexcept
{
    return m_session.departure;
}

bool PresenceMonitor::reconnectInFlight() const noexcept
{
    return m_reconnect.inFlight();
}

MonitorSnapshot PresenceMonitor::snapshot() const
{
    MonitorSnapshot out{};
    out.detecting = m_discovery.valid();
    out.devices = m_session.devices;
    out.selected = m_session.selected;
    out.state = m_session.machine.state();
    out.canLock = m_session.arbiter.canLock();
    out.confirmationTimeout = m_session.confirmationTimeout;
    out.reconnectInFlight = m_reconnect.inFlight();
    return out;
}

void PresenceMonitor::waitForReconnection()
{
    m_reconnect.waitIdle();
}

void PresenceMonitor::publish(MonitorEvent event) const
{
    if (m_sink)
    {
        m_sink(event);
    }
}

bool PresenceMonitor::finishDiscovery()
{
    std::vector<tetherlock::device::DeviceHandle> handles{};
    try
    {
        handles = m_discovery.get();
    }
    catch (const tetherlock::device::ProbeUnavailable&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        publish(MonitorEvent{ MonitorEventKind::DiscoveryFailed, {}, {}, {}, e.what() });
        startDiscovery();
        return false;
    }

    m_session.devices.clear();
    m_session.devices.reserve(handles.size());
    for (auto& handle : handles)
    {
        tetherlock::device::TrackedDevice device{};
        device.handle = std::move(handle);
        m_session.devices.push_back(std::move(device));
    }

    if (m_session.devices.empty())
    {
        publish(MonitorEvent{ MonitorEventKind::NoDevicesFound, {}, {}, {}, {} });
        return true;
    }

    publish(MonitorEvent{ MonitorEventKind::DiscoveryFinished, {}, {}, {},
                          std::to_string(m_session.devices.size()) + " device(s)" });

    if (m_preferred)
    {
        if (!select(*m_preferred))
        {
            publish(MonitorEvent{ MonitorEventKind::PreferredDeviceMissing, m_preferred->address, {}, {}, {} });
        }
        m_preferred.reset();
    }
    return true;
}

bool PresenceMonitor::refreshDevices()
{
    bool selectedProbed{ true };
    for (std::size_t i{}; i < m_session.devices.size(); ++i)
    {
        auto& device{ m_session.devices[i] };
        try
        {
            m_source->refresh(device.handle);
            const bool connected{ m_source->isConnected(device.handle) };
            auto name{ m_source->name(device.handle) };

            device.connected = connected;
            device.displayName = std::move(name);
        }
        catch (const tetherlock::device::ProbeUnavailable&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            publish(MonitorEvent{ MonitorEventKind::ProbeFailed, labelOf(device), {}, {}, e.what() });
            if (m_session.selected == i)
            {
                selectedProbed = false;
            }
        }
    }
    return selectedProbed;
}

void PresenceMonitor::evaluate(bool connected)
{
    if (connected)
    {
        fire(PresenceTrigger::Connected);
        return;
    }

    switch (m_session.machine.state())
    {
    case PresenceState::Connected:
        fire(PresenceTrigger::WaitingConfirmDisconnect);
        break;
    case PresenceState::WaitingConfirmDisconnect:
        if (m_session.departure.hasElapsed(m_session.confirmationTimeout))
        {
            fire(PresenceTrigger::Disconnected);
        }
        break;
    case PresenceState::None:
    case PresenceState::Disconnected:
        break;
    }
}

void PresenceMonitor::fire(PresenceTrigger trigger)
{
    const auto transition{ m_session.machine.fire(trigger) };
    if (!transition.changed())
    {
        return;
    }
    onTransition(transition);
}

void PresenceMonitor::onTransition(const Transition& transition)
{
    if (transition.from == PresenceState::WaitingConfirmDisconnect)
    {
        m_session.departure.cancel();
    }

    publish(MonitorEvent{ MonitorEventKind::StateChanged, selectedLabel(), transition.from, transition.to, {} });

    switch (transition.to)
    {
    case PresenceState::Connected:
        m_session.arbiter.grant();
        break;

    case PresenceState::WaitingConfirmDisconnect:
        m_session.departure.begin();
        break;

    case PresenceState::Disconnected:
    {
        const auto decision{ m_session.arbiter.maybeLock(transition.from, transition.to) };
        if (decision == LockDecision::Locked)
        {
            publish(
                MonitorEvent{ MonitorEventKind::SessionLocked, selectedLabel(), transition.from, transition.to, {} });
        }
        else if (decision == LockDecision::Failed)
        {
            publish(MonitorEvent{ MonitorEventKind::LockFailed, selectedLabel(), transition.from, transition.to,
                                  m_session.arbiter.lastFailure() });
        }
        break;
    }

    case PresenceState::None:
        break;
    }
}

void PresenceMonitor::close()
{
    m_session.arbiter.revoke();
    fire(PresenceTrigger::Close);
}

std::string PresenceMonitor::selectedLabel() const
{
    if (!m_session.selected)
    {
        return {};
    }
    return labelOf(m_session.devices[*m_session.selected]);
}

} // namespace tetherlock::core
