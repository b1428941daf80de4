#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "tetherlock/core/MonitorSettings.hpp"
#include "tetherlock/device/TrackedDevice.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tetherlock::ui::cli
{
namespace
{

constexpr std::size_t g_kMaxIndexDigits{ 6 };

[[nodiscard]] bool isIndex(const std::string& s)
{
    return !s.empty() && s.size() <= g_kMaxIndexDigits &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

[[nodiscard]] std::vector<int> timeoutChoices()
{
    std::vector<int> out{};
    for (const auto choice : tetherlock::core::g_confirmationTimeoutChoices)
    {
        out.push_back(static_cast<int>(choice.count()));
    }
    return out;
}

} // namespace

InteractiveShell::InteractiveShell(tetherlock::core::PollLoop& loop, std::istream& in, std::ostream& out)
    : m_loop(loop), m_in(in), m_out(out)
{
}

template <class Fn> auto InteractiveShell::apply(Fn&& fn)
{
    return m_loop.post(std::forward<Fn>(fn)).get();
}

int InteractiveShell::run()
{
    m_out << "tetherlock console\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running)
    {
        if (!m_loop.running())
        {
            m_out << "Monitor stopped.\n";
            break;
        }

        m_out << "tlk> " << std::flush;
        const auto status{ m_in.next(line, [this]() { return m_loop.running(); }) };
        if (status == LineReader::Status::Abandoned)
        {
            m_out << "\nMonitor stopped.\n";
            break;
        }
        if (status == LineReader::Status::EndOfInput)
        {
            break;
        }

        if (line.empty())
        {
            continue;
        }

        try
        {
            processLine(line);
        }
        catch (const std::future_error&)
        {
            // The loop shut down before it could run the command.
            m_out << "Monitor stopped.\n";
            break;
        }
    }
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    std::vector<std::string> userArgs = Tokenizer::tokenize(line);

    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    CLI::App app{ "tetherlock console" };
    app.name("tlk");
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Stop monitoring and exit")->alias("quit")->callback([this]() { m_running = false; });

    app.add_subcommand("devices", "List discovered devices")->callback([this]() { doDevices(); });

    std::string target;
    auto* subSelect = app.add_subcommand("select", "Monitor a device by list index or address");
    subSelect->add_option("device", target, "Index from 'devices' or Bluetooth address")->required();
    subSelect->callback([&]() { doSelect(target); });

    app.add_subcommand("disable", "Stop monitoring the selected device")->callback([this]() { doDisable(); });

    int seconds{ 0 };
    auto* subTimeout = app.add_subcommand("timeout", "Set the confirmation timeout in seconds");
    subTimeout->add_option("seconds", seconds, "Seconds of absence before locking")
        ->required()
        ->check(CLI::IsMember(timeoutChoices()));
    subTimeout->callback([&]() { doTimeout(seconds); });

    app.add_subcommand("status", "Show monitor state")->callback([this]() { doStatus(); });

    try
    {
        // The vector overload consumes arguments from the back.
        std::vector<std::string> args(userArgs.rbegin(), userArgs.rend());
        app.parse(args);
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

void InteractiveShell::doDevices()
{
    const auto snapshot{ m_loop.snapshot() };
    if (snapshot.detecting)
    {
        m_out << "Detecting Bluetooth devices...\n";
        return;
    }
    if (snapshot.devices.empty())
    {
        m_out << "No devices found.\n";
        return;
    }

    for (std::size_t i{}; i < snapshot.devices.size(); ++i)
    {
        const char marker{ (snapshot.selected == i) ? '*' : ' ' };
        m_out << marker << " [" << i << "] " << tetherlock::device::describe(snapshot.devices[i]) << "  "
              << snapshot.devices[i].handle.address << "\n";
    }
}

void InteractiveShell::doSelect(const std::string& target)
{
    std::optional<std::string> selected{};
    const auto selectedDevice{ [](tetherlock::core::PresenceMonitor& monitor) -> std::optional<std::string>
                               {
                                   const auto index{ monitor.selectedIndex() };
                                   if (!index)
                                   {
                                       return std::nullopt;
                                   }
                                   return tetherlock::device::describe(monitor.devices()[*index]);
                               } };

    if (isIndex(target))
    {
        const auto index{ static_cast<std::size_t>(std::stoul(target)) };
        selected = apply(
            [index, selectedDevice](tetherlock::core::PresenceMonitor& monitor)
            { return monitor.selectIndex(index) ? selectedDevice(monitor) : std::nullopt; });
    }
    else
    {
        tetherlock::device::DeviceHandle handle{ target };
        selected = apply(
            [handle, selectedDevice](tetherlock::core::PresenceMonitor& monitor)
            { return monitor.select(handle) ? selectedDevice(monitor) : std::nullopt; });
    }

    if (!selected)
    {
        m_out << "Error: No such device: " << target << "\n";
        return;
    }
    m_out << "Monitoring " << *selected << ".\n";
}

void InteractiveShell::doDisable()
{
    apply([](tetherlock::core::PresenceMonitor& monitor) { monitor.deselect(); });
    m_out << "Monitoring disabled.\n";
}

void InteractiveShell::doTimeout(int seconds)
{
    const std::chrono::seconds timeout{ seconds };
    apply([timeout](tetherlock::core::PresenceMonitor& monitor) { monitor.setConfirmationTimeout(timeout); });
    m_out << "Confirmation timeout set to " << seconds << " s.\n";
}

void InteractiveShell::doStatus()
{
    const auto snapshot{ m_loop.snapshot() };

    m_out << "State:      " << tetherlock::core::toString(snapshot.state) << "\n";
    m_out << "Device:     ";
    if (snapshot.detecting)
    {
        m_out << "(detecting)\n";
    }
    else if (snapshot.selected)
    {
        const auto& device{ snapshot.devices[*snapshot.selected] };
        m_out << tetherlock::device::describe(device) << " " << device.handle.address << "\n";
    }
    else
    {
        m_out << "(none)\n";
    }
    m_out << "Timeout:    " << snapshot.confirmationTimeout.count() << " s\n";
    m_out << "Lock armed: " << (snapshot.canLock ? "yes" : "no") << "\n";
    if (snapshot.reconnectInFlight)
    {
        m_out << "Reconnecting...\n";
    }
}

} // namespace tetherlock::ui::cli
