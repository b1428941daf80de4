#ifndef INCLUDE_TETHERLOCK_DEVICE_IDEVICEPRESENCESOURCE_HPP
#define INCLUDE_TETHERLOCK_DEVICE_IDEVICEPRESENCESOURCE_HPP

#include "tetherlock/device/TrackedDevice.hpp"
#include <string>
#include <vector>

namespace tetherlock::device
{

// Every call may throw ProbeUnavailable (no radio stack on this platform) or
// TransientProbeFailure (anything else; retried on the next tick).
class IDevicePresenceSource
{
public:
    IDevicePresenceSource() = default;
    IDevicePresenceSource(const IDevicePresenceSource&) = delete;
    IDevicePresenceSource& operator=(const IDevicePresenceSource&) = delete;
    IDevicePresenceSource(IDevicePresenceSource&&) = delete;
    IDevicePresenceSource& operator=(IDevicePresenceSource&&) = delete;
    virtual ~IDevicePresenceSource() = default;

    // Enumerates candidate devices. Blocking; callers run it off the polling path.
    [[nodiscard]] virtual std::vector<DeviceHandle> discover() = 0;

    // Updates cached connectivity and name. Must return within a bounded time.
    virtual void refresh(const DeviceHandle& device) = 0;

    [[nodiscard]] virtual bool isConnected(const DeviceHandle& device) const = 0;
    [[nodiscard]] virtual std::string name(const DeviceHandle& device) const = 0;

    // Best-effort connect. May run on a worker thread concurrently with refresh().
    virtual void attemptConnect(const DeviceHandle& device) = 0;
};

} // namespace tetherlock::device

#endif // INCLUDE_TETHERLOCK_DEVICE_IDEVICEPRESENCESOURCE_HPP
