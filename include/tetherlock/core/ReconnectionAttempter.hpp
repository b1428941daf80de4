#ifndef INCLUDE_TETHERLOCK_CORE_RECONNECTIONATTEMPTER_HPP
#define INCLUDE_TETHERLOCK_CORE_RECONNECTIONATTEMPTER_HPP

#include "tetherlock/device/IDevicePresenceSource.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace tetherlock::core
{

enum class ReconnectOutcome : std::uint8_t
{
    None,
    Succeeded,
    Failed,
};

// Runs IDevicePresenceSource::attemptConnect() on a worker thread, one attempt at a time.
// The outcome is only reported; it never feeds back into presence evaluation.
class ReconnectionAttempter final
{
public:
    // Invoked on the worker thread once an attempt has finished.
    using CompletionHandler =
        std::function<void(const tetherlock::device::DeviceHandle&, ReconnectOutcome, const std::string&)>;

    explicit ReconnectionAttempter(tetherlock::device::IDevicePresenceSource& source,
                                   CompletionHandler onComplete = {});

    ReconnectionAttempter(const ReconnectionAttempter&) = delete;
    ReconnectionAttempter& operator=(const ReconnectionAttempter&) = delete;
    ReconnectionAttempter(ReconnectionAttempter&&) = delete;
    ReconnectionAttempter& operator=(ReconnectionAttempter&&) = delete;
    ~ReconnectionAttempter();

    // Never blocks on the attempt itself. Returns false when an attempt is still in flight.
    bool tryLaunch(const tetherlock::device::DeviceHandle& device);

    [[nodiscard]] bool inFlight() const noexcept;
    [[nodiscard]] ReconnectOutcome lastOutcome() const noexcept;

    // Blocks until the current attempt, if any, has finished.
    void waitIdle();

private:
    void run(tetherlock::device::DeviceHandle device);

    tetherlock::device::IDevicePresenceSource* m_source{ nullptr };
    CompletionHandler m_onComplete;
    std::atomic<bool> m_inFlight{ false };
    std::atomic<ReconnectOutcome> m_lastOutcome{ ReconnectOutcome::None };
    std::jthread m_worker;
};

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_RECONNECTIONATTEMPTER_HPP
