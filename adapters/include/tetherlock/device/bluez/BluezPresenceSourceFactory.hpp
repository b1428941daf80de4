#ifndef INCLUDE_TETHERLOCK_DEVICE_BLUEZ_BLUEZPRESENCESOURCEFACTORY_HPP
#define INCLUDE_TETHERLOCK_DEVICE_BLUEZ_BLUEZPRESENCESOURCEFACTORY_HPP

#include "tetherlock/device/IDevicePresenceSource.hpp"
#include <memory>

namespace tetherlock::device::bluez
{

// Paired devices of the local BlueZ daemon, probed over the system D-Bus.
// Requires a QCoreApplication instance.
[[nodiscard]] std::unique_ptr<tetherlock::device::IDevicePresenceSource> makeBluezPresenceSource();

} // namespace tetherlock::device::bluez

#endif // INCLUDE_TETHERLOCK_DEVICE_BLUEZ_BLUEZPRESENCESOURCEFACTORY_HPP
