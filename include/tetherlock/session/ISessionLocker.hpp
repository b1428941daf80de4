#ifndef INCLUDE_TETHERLOCK_SESSION_ISESSIONLOCKER_HPP
#define INCLUDE_TETHERLOCK_SESSION_ISESSIONLOCKER_HPP

namespace tetherlock::session
{

class ISessionLocker
{
public:
    ISessionLocker() = default;
    ISessionLocker(const ISessionLocker&) = delete;
    ISessionLocker& operator=(const ISessionLocker&) = delete;
    ISessionLocker(ISessionLocker&&) = delete;
    ISessionLocker& operator=(ISessionLocker&&) = delete;
    virtual ~ISessionLocker() = default;

    // Locks the current interactive session. Throws LockActionFailure when the OS refuses.
    virtual void lockSession() = 0;
};

} // namespace tetherlock::session

#endif // INCLUDE_TETHERLOCK_SESSION_ISESSIONLOCKER_HPP
