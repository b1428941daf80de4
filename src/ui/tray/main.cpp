#include "TrayController.hpp"
#include "tetherlock/core/PresenceMonitor.hpp"
#include "tetherlock/device/DeviceErrors.hpp"
#include "tetherlock/device/PlatformPresenceSource.hpp"
#include "tetherlock/log/QtMonitorLog.hpp"
#include "tetherlock/session/providers/SystemSessionLockerFactory.hpp"
#include <QApplication>
#include <QtGlobal>
#include <exception>

int main(int argc, char* argv[])
{
#if defined(__linux__)
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM"))
    {
        qputenv("QT_QPA_PLATFORM", "xcb");
    }
#endif
    QApplication app(argc, argv);
    QApplication::setQuitOnLastWindowClosed(false);
    QApplication::setApplicationName("tetherlock");

    tetherlock::log::installMessagePattern();
    tetherlock::log::setVerbose(qEnvironmentVariableIsSet("TETHERLOCK_VERBOSE"));

    try
    {
        auto source = tetherlock::device::makePlatformPresenceSource();
        auto locker = tetherlock::session::providers::makeSystemSessionLocker();

        tetherlock::core::PresenceMonitor monitor(*source, *locker);
        monitor.setEventSink(tetherlock::log::makeQtEventSink());
        monitor.startDiscovery();

        TrayController tray(monitor);
        QObject::connect(&tray, &TrayController::stopped, &app, [](int exitCode) { QCoreApplication::exit(exitCode); },
                         Qt::QueuedConnection);
        tray.start();

        const int exitCode = QApplication::exec();
        monitor.waitForReconnection();
        if (exitCode == 0)
        {
            qCInfo(lcTetherlockMonitor) << "Service stopped";
        }
        return exitCode;
    }
    catch (const tetherlock::device::ProbeUnavailable& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "Bluetooth is unavailable:" << e.what();
        return 2;
    }
    catch (const std::exception& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "fatal:" << e.what();
        return 1;
    }
}
