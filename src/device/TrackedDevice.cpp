#include "tetherlock/device/TrackedDevice.hpp"

namespace tetherlock::device
{

std::string describe(const TrackedDevice& device)
{
    std::string out{ device.displayName.empty() ? device.handle.address : device.displayName };
    out += device.connected ? " (Connected)" : " (Disconnected)";
    return out;
}

} // namespace tetherlock::device
