#ifndef SRC_UI_TRAY_TRAYCONTROLLER_HPP
#define SRC_UI_TRAY_TRAYCONTROLLER_HPP
#include "tetherlock/core/PresenceMonitor.hpp"
#include <QAction>
#include <QActionGroup>
#include <QList>
#include <QMenu>
#include <QObject>
#include <QString>
#include <QSystemTrayIcon>
#include <QTimer>
#include <chrono>
#include <memory>

// Tray front end: drives the monitor from a GUI-thread timer and mirrors it in the tray menu.
class TrayController : public QObject
{
    Q_OBJECT
public:
    explicit TrayController(tetherlock::core::PresenceMonitor& monitor,
                            std::chrono::milliseconds interval = tetherlock::core::g_defaultPollInterval,
                            QObject* parent = nullptr);
    ~TrayController() override;

    void start();

    [[nodiscard]] QMenu* menu() const;
    [[nodiscard]] QString toolTip() const;

public slots:
    void tick();

signals:
    // Monitoring cannot continue; the owner should leave the event loop with `exitCode`.
    void stopped(int exitCode);
    void refreshed();

private:
    void setupMenu();
    void setupTray();
    void refreshView();
    void rebuildDeviceActions();
    void stop(int exitCode);

    tetherlock::core::PresenceMonitor& m_monitor;

    QTimer* m_tickTimer{ nullptr };
    std::unique_ptr<QMenu> m_menu;
    QMenu* m_timeoutMenu{ nullptr };
    QAction* m_placeholderAction{ nullptr };
    QAction* m_deviceSeparator{ nullptr };
    QAction* m_disableAction{ nullptr };
    QActionGroup* m_deviceGroup{ nullptr };
    QActionGroup* m_timeoutGroup{ nullptr };
    QList<QAction*> m_deviceActions;
    QString m_toolTip;
    bool m_stopped{ false };

    QSystemTrayIcon* m_trayIcon{ nullptr };
};

#endif // SRC_UI_TRAY_TRAYCONTROLLER_HPP
