#ifndef INCLUDE_TETHERLOCK_SESSION_SESSIONERRORS_HPP
#define INCLUDE_TETHERLOCK_SESSION_SESSIONERRORS_HPP

#include <stdexcept>

namespace tetherlock::session
{

class LockActionFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace tetherlock::session

#endif // INCLUDE_TETHERLOCK_SESSION_SESSIONERRORS_HPP
