#include "tetherlock/core/PollLoop.hpp"
#include <vector>

namespace tetherlock::core
{

PollLoop::PollLoop(PresenceMonitor& monitor, std::chrono::milliseconds interval)
    : m_monitor(&monitor), m_interval(interval)
{
}

PollLoop::~PollLoop()
{
    requestStop();
    if (m_thread.joinable())
    {
        m_thread.join();
    }
}

void PollLoop::setFaultHandler(FaultHandler handler)
{
    m_onFault = std::move(handler);
}

void PollLoop::start()
{
    if (m_thread.joinable())
    {
        return;
    }

    {
        std::scoped_lock lock{ m_mutex };
        m_snapshot = m_monitor->snapshot();
        m_fault = nullptr;
        m_accepting = true;
    }

    m_running.store(true, std::memory_order_release);
    m_thread = std::jthread{ [this](std::stop_token stop) { run(std::move(stop)); } };
}

void PollLoop::requestStop() noexcept
{
    m_thread.request_stop();
}

void PollLoop::wait()
{
    if (m_thread.joinable())
    {
        m_thread.join();
    }

    std::exception_ptr fault{};
    {
        std::scoped_lock lock{ m_mutex };
        fault = std::exchange(m_fault, nullptr);
    }
    if (fault)
    {
        std::rethrow_exception(fault);
    }
}

bool PollLoop::running() const noexcept
{
    return m_running.load(std::memory_order_acquire);
}

std::uint64_t PollLoop::tickCount() const noexcept
{
    return m_ticks.load(std::memory_order_acquire);
}

TickStatus PollLoop::lastStatus() const
{
    std::scoped_lock lock{ m_mutex };
    return m_lastStatus;
}

MonitorSnapshot PollLoop::snapshot() const
{
    std::scoped_lock lock{ m_mutex };
    return m_snapshot;
}

void PollLoop::enqueue(Command command)
{
    {
        std::scoped_lock lock{ m_mutex };
        if (!m_accepting)
        {
            return;
        }
        m_commands.push_back(std::move(command));
    }
    m_wake.notify_one();
}

void PollLoop::run(std::stop_token stop)
{
    std::exception_ptr fault{};
    try
    {
        while (!stop.stop_requested())
        {
            drainCommands();
            const auto status{ m_monitor->tick() };
            m_ticks.fetch_add(1, std::memory_order_acq_rel);
            publishSnapshot(status);

            // Sleep until the next tick, waking early for stop requests and to apply posted commands.
            const auto deadline{ std::chrono::steady_clock::now() + m_interval };
            std::unique_lock lock{ m_mutex };
            while (m_wake.wait_until(lock, stop, deadline, [this]() { return !m_commands.empty(); }))
            {
                lock.unlock();
                drainCommands();
                lock.lock();
            }
        }
    }
    catch (...)
    {
        fault = std::current_exception();
    }

    if (fault)
    {
        {
            // Surfaced to the owner through wait().
            std::scoped_lock lock{ m_mutex };
            m_fault = fault;
        }
        if (m_onFault)
        {
            m_onFault(fault);
        }
    }

    m_monitor->waitForReconnection();

    std::deque<Command> dropped{};
    {
        std::scoped_lock lock{ m_mutex };
        m_accepting = false;
        dropped.swap(m_commands);
    }
    dropped.clear();

    m_running.store(false, std::memory_order_release);
}

void PollLoop::drainCommands()
{
    std::deque<Command> pending{};
    {
        std::scoped_lock lock{ m_mutex };
        pending.swap(m_commands);
    }

    if (pending.empty())
    {
        return;
    }

    std::vector<Completion> completions{};
    completions.reserve(pending.size());
    for (auto& command : pending)
    {
        completions.push_back(command(*m_monitor));
    }

    publishSnapshot(std::nullopt);
    for (auto& complete : completions)
    {
        complete();
    }
}

void PollLoop::publishSnapshot(std::optional<TickStatus> status)
{
    auto snapshot{ m_monitor->snapshot() };

    std::scoped_lock lock{ m_mutex };
    m_snapshot = std::move(snapshot);
    if (status)
    {
        m_lastStatus = *status;
    }
}

} // namespace tetherlock::core
