#ifndef INCLUDE_TETHERLOCK_SESSION_PROVIDERS_SYSTEMSESSIONLOCKERFACTORY_HPP
#define INCLUDE_TETHERLOCK_SESSION_PROVIDERS_SYSTEMSESSIONLOCKERFACTORY_HPP

#include "tetherlock/session/ISessionLocker.hpp"
#include <memory>

namespace tetherlock::session::providers
{

// Linux: systemd-logind over the system D-Bus. Windows: LockWorkStation().
[[nodiscard]] std::unique_ptr<tetherlock::session::ISessionLocker> makeSystemSessionLocker();

} // namespace tetherlock::session::providers

#endif // INCLUDE_TETHERLOCK_SESSION_PROVIDERS_SYSTEMSESSIONLOCKERFACTORY_HPP
