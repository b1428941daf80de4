#include "tetherlock/core/MonitorEvent.hpp"

namespace tetherlock::core
{
namespace
{

[[nodiscard]] std::string stateSentence(const MonitorEvent& event)
{
    switch (event.to)
    {
    case PresenceState::Connected:
        return "Device connected";
    case PresenceState::WaitingConfirmDisconnect:
        return "Device disconnected. Waiting for confirmation...";
    case PresenceState::Disconnected:
        return "Device disconnected";
    case PresenceState::None:
        return "Device released";
    }
    return "Device state changed";
}

void appendDevice(std::string& out, const MonitorEvent& event)
{
    if (!event.device.empty())
    {
        out += ": ";
        out += event.device;
    }
}

void appendDetail(std::string& out, const MonitorEvent& event)
{
    if (!event.detail.empty())
    {
        out += " (";
        out += event.detail;
        out += ")";
    }
}

} // namespace

EventSeverity severityOf(MonitorEventKind kind) noexcept
{
    switch (kind)
    {
    case MonitorEventKind::ReconnectStarted:
    case MonitorEventKind::ReconnectSucceeded:
    case MonitorEventKind::ReconnectFailed:
        return EventSeverity::Debug;
    case MonitorEventKind::NoDevicesFound:
    case MonitorEventKind::DiscoveryFailed:
    case MonitorEventKind::PreferredDeviceMissing:
    case MonitorEventKind::ProbeFailed:
        return EventSeverity::Warning;
    case MonitorEventKind::LockFailed:
        return EventSeverity::Critical;
    case MonitorEventKind::DiscoveryStarted:
    case MonitorEventKind::DiscoveryFinished:
    case MonitorEventKind::DeviceSelected:
    case MonitorEventKind::DeviceDeselected:
    case MonitorEventKind::StateChanged:
    case MonitorEventKind::SessionLocked:
    case MonitorEventKind::TimeoutChanged:
        return EventSeverity::Info;
    }
    return EventSeverity::Info;
}

std::string describe(const MonitorEvent& event)
{
    std::string out{};
    switch (event.kind)
    {
    case MonitorEventKind::DiscoveryStarted:
        out = "Detecting Bluetooth devices...";
        break;
    case MonitorEventKind::DiscoveryFinished:
        out = "Discovery finished";
        break;
    case MonitorEventKind::NoDevicesFound:
        out = "No devices found";
        break;
    case MonitorEventKind::DiscoveryFailed:
        out = "Discovery failed, retrying";
        break;
    case MonitorEventKind::DeviceSelected:
        out = "Selected device";
        appendDevice(out, event);
        break;
    case MonitorEventKind::DeviceDeselected:
        out = "Monitoring disabled";
        break;
    case MonitorEventKind::PreferredDeviceMissing:
        out = "Requested device was not discovered";
        appendDevice(out, event);
        break;
    case MonitorEventKind::StateChanged:
        out = stateSentence(event);
        appendDevice(out, event);
        break;
    case MonitorEventKind::SessionLocked:
        out = "Session locked";
        appendDevice(out, event);
        break;
    case MonitorEventKind::LockFailed:
        out = "Failed to lock the session";
        break;
    case MonitorEventKind::ProbeFailed:
        out = "Probe failed";
        appendDevice(out, event);
        break;
    case MonitorEventKind::ReconnectStarted:
        out = "Reconnecting";
        appendDevice(out, event);
        break;
    case MonitorEventKind::ReconnectSucceeded:
        out = "Reconnect attempt finished";
        appendDevice(out, event);
        break;
    case MonitorEventKind::ReconnectFailed:
        out = "Reconnect attempt failed";
        appendDevice(out, event);
        break;
    case MonitorEventKind::TimeoutChanged:
        out = "Confirmation timeout changed";
        break;
    }

    appendDetail(out, event);
    return out;
}

} // namespace tetherlock::core
