#include "TrayController.hpp"
#include "tetherlock/core/MonitorSettings.hpp"
#include "tetherlock/device/DeviceErrors.hpp"
#include "tetherlock/device/TrackedDevice.hpp"
#include "tetherlock/log/QtMonitorLog.hpp"
#include <QApplication>
#include <QCoreApplication>
#include <QIcon>
#include <QStyle>
#include <exception>
#include <string>

namespace
{

constexpr int g_kExitFault{ 1 };
constexpr int g_kExitProbeUnavailable{ 2 };

[[nodiscard]] QString deviceLabel(const tetherlock::device::TrackedDevice& device)
{
    return QString::fromStdString(tetherlock::device::describe(device));
}

[[nodiscard]] QIcon iconFor(tetherlock::core::PresenceState state)
{
    auto* style{ QApplication::style() };
    if (style == nullptr)
    {
        return {};
    }

    switch (state)
    {
    case tetherlock::core::PresenceState::Connected:
        return style->standardIcon(QStyle::SP_DialogApplyButton);
    case tetherlock::core::PresenceState::WaitingConfirmDisconnect:
        return style->standardIcon(QStyle::SP_MessageBoxWarning);
    case tetherlock::core::PresenceState::Disconnected:
        return style->standardIcon(QStyle::SP_MessageBoxCritical);
    case tetherlock::core::PresenceState::None:
        break;
    }
    return style->standardIcon(QStyle::SP_ComputerIcon);
}

} // namespace

TrayController::TrayController(tetherlock::core::PresenceMonitor& monitor, std::chrono::milliseconds interval,
                               QObject* parent)
    : QObject(parent), m_monitor(monitor), m_menu(std::make_unique<QMenu>())
{
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_tickTimer = new QTimer(this);
    m_tickTimer->setInterval(static_cast<int>(interval.count()));
    connect(m_tickTimer, &QTimer::timeout, this, &TrayController::tick);

    setupMenu();
    setupTray();
    refreshView();
}

TrayController::~TrayController()
{
    if (m_trayIcon != nullptr)
    {
        m_trayIcon->setContextMenu(nullptr);
    }
}

void TrayController::start()
{
    tick();
    if (!m_tickTimer->isActive() && !m_stopped)
    {
        m_tickTimer->start();
    }
}

QMenu* TrayController::menu() const
{
    return m_menu.get();
}

QString TrayController::toolTip() const
{
    return m_toolTip;
}

void TrayController::tick()
{
    try
    {
        (void)m_monitor.tick();
    }
    catch (const tetherlock::device::ProbeUnavailable& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "Bluetooth is unavailable:" << e.what();
        stop(g_kExitProbeUnavailable);
        return;
    }
    catch (const std::exception& e)
    {
        qCCritical(lcTetherlockMonitor).noquote() << "fatal:" << e.what();
        stop(g_kExitFault);
        return;
    }

    refreshView();
}

void TrayController::setupMenu()
{
    m_deviceGroup = new QActionGroup(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_deviceGroup->setExclusionPolicy(QActionGroup::ExclusionPolicy::ExclusiveOptional);

    m_placeholderAction = m_menu->addAction("Detecting Bluetooth devices...");
    m_placeholderAction->setEnabled(false);
    m_deviceSeparator = m_menu->addSeparator();

    m_disableAction = m_menu->addAction("Disable");
    connect(m_disableAction, &QAction::triggered,
            [this]()
            {
                m_monitor.deselect();
                refreshView();
            });

    m_timeoutMenu = m_menu->addMenu("Confirmation timeout");
    m_timeoutGroup = new QActionGroup(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_timeoutGroup->setExclusive(true);
    for (const auto choice : tetherlock::core::g_confirmationTimeoutChoices)
    {
        auto* action = m_timeoutMenu->addAction(QString("%1 seconds").arg(choice.count()));
        action->setCheckable(true);
        action->setData(static_cast<int>(choice.count()));
        m_timeoutGroup->addAction(action);
        connect(action, &QAction::triggered,
                [this, choice]()
                {
                    m_monitor.setConfirmationTimeout(choice);
                    refreshView();
                });
    }

    m_menu->addSeparator();

    auto* exitAction = m_menu->addAction("Exit");
    connect(exitAction, &QAction::triggered, qApp, &QCoreApplication::quit);
}

void TrayController::setupTray()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable())
    {
        qWarning() << "System tray is not available.";
        return;
    }

    m_trayIcon = new QSystemTrayIcon(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_trayIcon->setIcon(iconFor(tetherlock::core::PresenceState::None));
    m_trayIcon->setContextMenu(m_menu.get());
    m_trayIcon->show();
}

void TrayController::refreshView()
{
    const auto& devices{ m_monitor.devices() };
    const auto selected{ m_monitor.selectedIndex() };
    const bool detecting{ m_monitor.discoveryPending() };

    if (m_deviceActions.size() != static_cast<qsizetype>(devices.size()))
    {
        rebuildDeviceActions();
    }
    for (qsizetype i{}; i < m_deviceActions.size(); ++i)
    {
        auto* action{ m_deviceActions[i] };
        const auto index{ static_cast<std::size_t>(i) };
        action->setText(deviceLabel(devices[index]));
        action->setChecked(selected == index);
    }

    m_placeholderAction->setText(detecting ? "Detecting Bluetooth devices..." : "No devices found");
    m_placeholderAction->setVisible(devices.empty());
    m_disableAction->setEnabled(selected.has_value());

    const int timeout{ static_cast<int>(m_monitor.confirmationTimeout().count()) };
    for (auto* action : m_timeoutGroup->actions())
    {
        action->setChecked(action->data().toInt() == timeout);
    }

    const auto state{ m_monitor.state() };
    QString tip{ "tetherlock" };
    if (detecting)
    {
        tip += "\nDetecting Bluetooth devices...";
    }
    else if (selected)
    {
        tip += "\nMonitoring: " + deviceLabel(devices[*selected]);
        tip += "\nState: " + QString::fromStdString(std::string{ tetherlock::core::toString(state) });
    }
    else
    {
        tip += "\nMonitoring disabled";
    }
    m_toolTip = tip;

    if (m_trayIcon != nullptr)
    {
        m_trayIcon->setToolTip(m_toolTip);
        m_trayIcon->setIcon(iconFor(selected ? state : tetherlock::core::PresenceState::None));
    }

    emit refreshed();
}

void TrayController::rebuildDeviceActions()
{
    for (auto* action : m_deviceActions)
    {
        m_deviceGroup->removeAction(action);
        m_menu->removeAction(action);
        action->deleteLater();
    }
    m_deviceActions.clear();

    const auto& devices{ m_monitor.devices() };
    for (std::size_t i{}; i < devices.size(); ++i)
    {
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        auto* action = new QAction(deviceLabel(devices[i]), m_menu.get());
        action->setCheckable(true);
        m_menu->insertAction(m_deviceSeparator, action);
        m_deviceGroup->addAction(action);
        connect(action, &QAction::triggered,
                [this, i]()
                {
                    (void)m_monitor.selectIndex(i);
                    refreshView();
                });
        m_deviceActions.push_back(action);
    }
}

void TrayController::stop(int exitCode)
{
    m_stopped = true;
    m_tickTimer->stop();
    m_menu->setEnabled(false);
    if (m_trayIcon != nullptr)
    {
        m_trayIcon->setToolTip("tetherlock\nMonitoring stopped");
    }
    emit stopped(exitCode);
}
