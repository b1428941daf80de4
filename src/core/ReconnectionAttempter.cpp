#include "tetherlock/core/ReconnectionAttempter.hpp"
#include <exception>
#include <utility>

namespace tetherlock::core
{

ReconnectionAttempter::ReconnectionAttempter(tetherlock::device::IDevicePresenceSource& source,
                                             CompletionHandler onComplete)
    : m_source(&source), m_onComplete(std::move(onComplete))
{
}

ReconnectionAttempter::~ReconnectionAttempter()
{
    waitIdle();
}

bool ReconnectionAttempter::tryLaunch(const tetherlock::device::DeviceHandle& device)
{
    bool expected{ false };
    if (!m_inFlight.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return false;
    }

    // The previous worker has already released the latch, so this join returns promptly.
    if (m_worker.joinable())
    {
        m_worker.join();
    }

    m_worker = std::jthread{ [this, device]() { run(device); } };
    return true;
}

bool ReconnectionAttempter::inFlight() const noexcept
{
    return m_inFlight.load(std::memory_order_acquire);
}

ReconnectOutcome ReconnectionAttempter::lastOutcome() const noexcept
{
    return m_lastOutcome.load(std::memory_order_acquire);
}

void ReconnectionAttempter::waitIdle()
{
    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

void ReconnectionAttempter::run(tetherlock::device::DeviceHandle device)
{
    ReconnectOutcome outcome{ ReconnectOutcome::Succeeded };
    std::string detail{};
    try
    {
        m_source->attemptConnect(device);
    }
    catch (const std::exception& e)
    {
        outcome = ReconnectOutcome::Failed;
        detail = e.what();
    }

    m_lastOutcome.store(outcome, std::memory_order_release);
    if (m_onComplete)
    {
        m_onComplete(device, outcome, detail);
    }

    // Released last: tryLaunch() joins this thread once it observes the latch open.
    m_inFlight.store(false, std::memory_order_release);
}

} // namespace tetherlock::core
