#ifndef INCLUDE_TETHERLOCK_CORE_DEPARTURETIMER_HPP
#define INCLUDE_TETHERLOCK_CORE_DEPARTURETIMER_HPP

#include <chrono>
#include <functional>
#include <optional>

namespace tetherlock::core
{

// Measures one pending-departure episode: how long the device has continuously looked absent.
class DepartureTimer final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;
    using NowProvider = std::function<TimePoint()>;

    explicit DepartureTimer(NowProvider nowProvider = Clock::now);

    void begin() noexcept;
    void cancel() noexcept;

    [[nodiscard]] bool isActive() const noexcept;
    [[nodiscard]] std::optional<TimePoint> startedAt() const noexcept;

    // Zero when no episode is active.
    [[nodiscard]] Duration elapsed() const noexcept;
    [[nodiscard]] bool hasElapsed(std::chrono::seconds timeout) const noexcept;

private:
    NowProvider m_now;
    std::optional<TimePoint> m_startedAt{};
};

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_DEPARTURETIMER_HPP
