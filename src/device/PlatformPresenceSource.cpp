#include "tetherlock/device/PlatformPresenceSource.hpp"
#include "tetherlock/device/DeviceErrors.hpp"

#if defined(__linux__)
#include "tetherlock/device/bluez/BluezPresenceSourceFactory.hpp"
#endif

namespace tetherlock::device
{

std::unique_ptr<IDevicePresenceSource> makePlatformPresenceSource()
{
#if defined(__linux__)
    return tetherlock::device::bluez::makeBluezPresenceSource();
#else
    throw ProbeUnavailable{ "Bluetooth presence is not supported on this platform" };
#endif
}

} // namespace tetherlock::device
