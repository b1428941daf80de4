#ifndef INCLUDE_TETHERLOCK_DEVICE_DEVICEERRORS_HPP
#define INCLUDE_TETHERLOCK_DEVICE_DEVICEERRORS_HPP

#include <stdexcept>

namespace tetherlock::device
{

// The platform has no usable radio stack. Fatal for the whole service.
class ProbeUnavailable final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A single probe call failed; the caller retries on its next tick.
class TransientProbeFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace tetherlock::device

#endif // INCLUDE_TETHERLOCK_DEVICE_DEVICEERRORS_HPP
