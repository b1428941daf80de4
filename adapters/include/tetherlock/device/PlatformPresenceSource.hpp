#ifndef INCLUDE_TETHERLOCK_DEVICE_PLATFORMPRESENCESOURCE_HPP
#define INCLUDE_TETHERLOCK_DEVICE_PLATFORMPRESENCESOURCE_HPP

#include "tetherlock/device/IDevicePresenceSource.hpp"
#include <memory>

namespace tetherlock::device
{

// Throws ProbeUnavailable on platforms without a supported Bluetooth backend.
[[nodiscard]] std::unique_ptr<IDevicePresenceSource> makePlatformPresenceSource();

} // namespace tetherlock::device

#endif // INCLUDE_TETHERLOCK_DEVICE_PLATFORMPRESENCESOURCE_HPP
