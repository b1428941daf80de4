#ifndef INCLUDE_TETHERLOCK_CORE_POLLLOOP_HPP
#define INCLUDE_TETHERLOCK_CORE_POLLLOOP_HPP

#include "tetherlock/core/MonitorSettings.hpp"
#include "tetherlock/core/PresenceMonitor.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>

namespace tetherlock::core
{

// Fixed-interval driver that owns a PresenceMonitor on its own thread.
// Other threads reach the monitor only through post() and read it through snapshot().
class PollLoop final
{
public:
    using FaultHandler = std::function<void(std::exception_ptr)>;

    explicit PollLoop(PresenceMonitor& monitor, std::chrono::milliseconds interval = g_defaultPollInterval);

    PollLoop(const PollLoop&) = delete;
    PollLoop& operator=(const PollLoop&) = delete;
    PollLoop(PollLoop&&) = delete;
    PollLoop& operator=(PollLoop&&) = delete;
    ~PollLoop();

    // Called on the loop thread as soon as a fault stops the loop, before running() turns false.
    // Install before start().
    void setFaultHandler(FaultHandler handler);

    void start();
    void requestStop() noexcept;

    // Joins the loop thread and rethrows the fault that stopped it, if any.
    void wait();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint64_t tickCount() const noexcept;
    [[nodiscard]] TickStatus lastStatus() const;
    [[nodiscard]] MonitorSnapshot snapshot() const;

    // Runs `fn(monitor)` on the loop thread before the next tick. The future becomes ready after snapshot()
    // reflects the command; it is broken (std::future_error) when the loop stops first.
    template <class Fn> auto post(Fn&& fn) -> std::future<std::invoke_result_t<Fn&, PresenceMonitor&>>
    {
        using Result = std::invoke_result_t<Fn&, PresenceMonitor&>;
        auto promise{ std::make_shared<std::promise<Result>>() };
        auto future{ promise->get_future() };
        enqueue(
            [promise, fn = std::forward<Fn>(fn)](PresenceMonitor& monitor) mutable -> Completion
            {
                try
                {
                    if constexpr (std::is_void_v<Result>)
                    {
                        fn(monitor);
                        return [promise]() { promise->set_value(); };
                    }
                    else
                    {
                        return [promise, result = fn(monitor)]() mutable { promise->set_value(std::move(result)); };
                    }
                }
                catch (...)
                {
                    return [promise, error = std::current_exception()]() { promise->set_exception(error); };
                }
            });
        return future;
    }

private:
    using Completion = std::function<void()>;
    using Command = std::function<Completion(PresenceMonitor&)>;

    void enqueue(Command command);
    void run(std::stop_token stop);
    void drainCommands();
    void publishSnapshot(std::optional<TickStatus> status);

    PresenceMonitor* m_monitor{ nullptr };
    std::chrono::milliseconds m_interval{};

    mutable std::mutex m_mutex;
    std::condition_variable_any m_wake;
    std::deque<Command> m_commands;
    MonitorSnapshot m_snapshot;
    TickStatus m_lastStatus{ TickStatus::Idle };
    std::exception_ptr m_fault;
    FaultHandler m_onFault;
    bool m_accepting{ false };

    std::atomic<bool> m_running{ false };
    std::atomic<std::uint64_t> m_ticks{ 0 };
    std::jthread m_thread;
};

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_POLLLOOP_HPP
