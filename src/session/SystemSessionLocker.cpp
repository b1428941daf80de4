#include "tetherlock/session/providers/SystemSessionLockerFactory.hpp"
#include "tetherlock/session/SessionErrors.hpp"
#include <QLoggingCategory>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QString>
#include <QtGlobal>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace tetherlock::session::providers
{
namespace
{

Q_LOGGING_CATEGORY(lcSession, "tetherlock.session", QtInfoMsg)

#if defined(_WIN32)

class WorkstationSessionLocker final : public tetherlock::session::ISessionLocker
{
public:
    void lockSession() override
    {
        if (::LockWorkStation() == 0)
        {
            throw LockActionFailure{ "LockWorkStation failed with error " + std::to_string(::GetLastError()) };
        }
        qCInfo(lcSession) << "workstation locked";
    }
};

#elif defined(__linux__)

const QString g_kLogindService{ QStringLiteral("org.freedesktop.login1") };
const QString g_kLogindPath{ QStringLiteral("/org/freedesktop/login1") };
const QString g_kManagerInterface{ QStringLiteral("org.freedesktop.login1.Manager") };
const QString g_kSessionInterface{ QStringLiteral("org.freedesktop.login1.Session") };

constexpr int g_kLockTimeoutMs{ 5000 };

[[nodiscard]] std::string describeError(const QDBusMessage& reply)
{
    return reply.errorName().toStdString() + ": " + reply.errorMessage().toStdString();
}

// Asks systemd-logind to lock the caller's session; the desktop's screen locker reacts to the Lock signal.
class LogindSessionLocker final : public tetherlock::session::ISessionLocker
{
public:
    LogindSessionLocker() : m_bus(QDBusConnection::systemBus())
    {
    }

    void lockSession() override
    {
        if (!m_bus.isConnected())
        {
            throw LockActionFailure{ "system D-Bus is not reachable: " + m_bus.lastError().message().toStdString() };
        }

        const auto sessionId{ qEnvironmentVariable("XDG_SESSION_ID") };
        if (!sessionId.isEmpty())
        {
            auto call{ QDBusMessage::createMethodCall(g_kLogindService, g_kLogindPath, g_kManagerInterface,
                                                      QStringLiteral("LockSession")) };
            call << sessionId;
            const auto reply{ m_bus.call(call, QDBus::Block, g_kLockTimeoutMs) };
            if (reply.type() == QDBusMessage::ReplyMessage)
            {
                qCInfo(lcSession) << "locked session" << sessionId;
                return;
            }
            qCWarning(lcSession).noquote() << "LockSession(" << sessionId
                                           << ") failed:" << QString::fromStdString(describeError(reply));
        }

        lockSessionOfProcess();
    }

private:
    void lockSessionOfProcess()
    {
        auto lookup{ QDBusMessage::createMethodCall(g_kLogindService, g_kLogindPath, g_kManagerInterface,
                                                    QStringLiteral("GetSessionByPID")) };
        lookup << static_cast<quint32>(::getpid());
        const auto found{ m_bus.call(lookup, QDBus::Block, g_kLockTimeoutMs) };
        if (found.type() != QDBusMessage::ReplyMessage || found.arguments().isEmpty())
        {
            throw LockActionFailure{ "no logind session for this process: " + describeError(found) };
        }

        const auto sessionPath{ found.arguments().constFirst().value<QDBusObjectPath>().path() };
        auto lock{ QDBusMessage::createMethodCall(g_kLogindService, sessionPath, g_kSessionInterface,
                                                  QStringLiteral("Lock")) };
        const auto reply{ m_bus.call(lock, QDBus::Block, g_kLockTimeoutMs) };
        if (reply.type() != QDBusMessage::ReplyMessage)
        {
            throw LockActionFailure{ "Lock on " + sessionPath.toStdString() + " failed: " + describeError(reply) };
        }
        qCInfo(lcSession) << "locked session" << sessionPath;
    }

    QDBusConnection m_bus;
};

#endif

} // namespace

std::unique_ptr<tetherlock::session::ISessionLocker> makeSystemSessionLocker()
{
#if defined(_WIN32)
    return std::make_unique<WorkstationSessionLocker>();
#else
    return std::make_unique<LogindSessionLocker>();
#endif
}

} // namespace tetherlock::session::providers
