#ifndef INCLUDE_TETHERLOCK_DEVICE_TRACKEDDEVICE_HPP
#define INCLUDE_TETHERLOCK_DEVICE_TRACKEDDEVICE_HPP

#include <string>

namespace tetherlock::device
{

struct DeviceHandle final
{
    std::string address;

    [[nodiscard]] bool operator==(const DeviceHandle&) const = default;
};

struct TrackedDevice final
{
    DeviceHandle handle{};
    std::string displayName;
    bool connected{ false };
};

// "Name (Connected)" / "Name (Disconnected)", falling back to the address when the name is unknown.
[[nodiscard]] std::string describe(const TrackedDevice& device);

} // namespace tetherlock::device

#endif // INCLUDE_TETHERLOCK_DEVICE_TRACKEDDEVICE_HPP
