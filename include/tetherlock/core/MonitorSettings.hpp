#ifndef INCLUDE_TETHERLOCK_CORE_MONITORSETTINGS_HPP
#define INCLUDE_TETHERLOCK_CORE_MONITORSETTINGS_HPP

#include <algorithm>
#include <array>
#include <chrono>

namespace tetherlock::core
{

inline constexpr std::chrono::seconds g_defaultConfirmationTimeout{ 5 };
inline constexpr std::array<std::chrono::seconds, 3> g_confirmationTimeoutChoices{
    std::chrono::seconds{ 3 },
    std::chrono::seconds{ 5 },
    std::chrono::seconds{ 15 },
};

inline constexpr std::chrono::milliseconds g_defaultPollInterval{ 1000 };

[[nodiscard]] constexpr bool isSupportedConfirmationTimeout(std::chrono::seconds timeout) noexcept
{
    return std::find(g_confirmationTimeoutChoices.begin(), g_confirmationTimeoutChoices.end(), timeout) !=
           g_confirmationTimeoutChoices.end();
}

} // namespace tetherlock::core

#endif // INCLUDE_TETHERLOCK_CORE_MONITORSETTINGS_HPP
