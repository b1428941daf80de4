#include "InteractiveShell.hpp"
#include "tetherlock/core/MonitorSettings.hpp"
#include "tetherlock/core/PollLoop.hpp"
#include "tetherlock/core/PresenceMonitor.hpp"
#include "tetherlock/device/DeviceErrors.hpp"
#include "tetherlock/device/PlatformPresenceSource.hpp"
#include "tetherlock/log/QtMonitorLog.hpp"
#include "tetherlock/session/providers/SystemSessionLockerFactory.hpp"

#include <CLI/CLI.hpp>
#include <QCoreApplication>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

constexpr int g_kExitFault{ 1 };
constexpr int g_kExitProbeUnavailable{ 2 };
constexpr std::chrono::milliseconds g_kMinInterval{ 100 };
constexpr std::chrono::milliseconds g_kDiscoveryPoll{ 50 };

struct Options final
{
    int timeoutSeconds{ static_cast<int>(tetherlock::core::g_defaultConfirmationTimeout.count()) };
    std::string device;
    int intervalMs{ static_cast<int>(tetherlock::core::g_defaultPollInterval.count()) };
    bool verbose{ false };
};

// Reports a dead loop right away; the shell stops waiting for input and main exits through wait().
void reportLoopFault(std::exception_ptr fault) noexcept
{
    try
    {
        std::rethrow_exception(fault);
    }
    catch (const tetherlock::device::ProbeUnavailable& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "Monitoring stopped, Bluetooth is unavailable:" << e.what();
    }
    catch (const std::exception& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "Monitoring stopped:" << e.what();
    }
    catch (...)
    {
        qCCritical(lcTetherlockMonitor) << "Monitoring stopped by an unknown fault";
    }
}

// Holds the prompt back until the first device list is in, so a missing Bluetooth stack is reported
// before the operator starts typing.
void awaitDiscovery(const tetherlock::core::PollLoop& loop)
{
    while (loop.running() && loop.snapshot().detecting)
    {
        std::this_thread::sleep_for(g_kDiscoveryPoll);
    }
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tetherlock");

    Options options{};
    CLI::App cli{ "Locks the session when a paired Bluetooth device leaves" };
    std::vector<int> timeoutChoices{};
    for (const auto choice : tetherlock::core::g_confirmationTimeoutChoices)
    {
        timeoutChoices.push_back(static_cast<int>(choice.count()));
    }
    cli.add_option("-t,--timeout", options.timeoutSeconds, "Seconds a device must stay away before locking")
        ->check(CLI::IsMember(timeoutChoices))
        ->capture_default_str();
    cli.add_option("-d,--device", options.device, "Bluetooth address to monitor once discovery finishes");
    cli.add_option("--interval-ms", options.intervalMs, "Polling interval in milliseconds")
        ->check(CLI::Range(static_cast<int>(g_kMinInterval.count()), 60000))
        ->capture_default_str();
    cli.add_flag("-v,--verbose", options.verbose, "Enable debug logging");

    try
    {
        cli.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return cli.exit(e);
    }

    tetherlock::log::installMessagePattern();
    tetherlock::log::setVerbose(options.verbose);

    try
    {
        auto source{ tetherlock::device::makePlatformPresenceSource() };
        auto locker{ tetherlock::session::providers::makeSystemSessionLocker() };

        tetherlock::core::PresenceMonitor monitor{ *source, *locker };
        monitor.setEventSink(tetherlock::log::makeQtEventSink());
        monitor.setConfirmationTimeout(std::chrono::seconds{ options.timeoutSeconds });
        if (!options.device.empty())
        {
            monitor.setPreferredDevice(tetherlock::device::DeviceHandle{ options.device });
        }
        monitor.startDiscovery();

        tetherlock::core::PollLoop loop{ monitor, std::chrono::milliseconds{ options.intervalMs } };
        loop.setFaultHandler(reportLoopFault);
        loop.start();
        awaitDiscovery(loop);

        tetherlock::ui::cli::InteractiveShell shell{ loop, std::cin, std::cout };
        (void)shell.run();

        loop.requestStop();
        loop.wait();

        qCInfo(lcTetherlockMonitor) << "Service stopped";
        return 0;
    }
    catch (const tetherlock::device::ProbeUnavailable& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "Bluetooth is unavailable:" << e.what();
        return g_kExitProbeUnavailable;
    }
    catch (const std::exception& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "fatal:" << e.what();
        return g_kExitFault;
    }
}
