#include "tetherlock/device/bluez/BluezPresenceSourceFactory.hpp"
#include "BluezObjects.hpp"

#include "tetherlock/device/DeviceErrors.hpp"
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusMetaType>
#include <QLoggingCategory>
#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tetherlock::device::bluez
{
namespace
{

Q_LOGGING_CATEGORY(lcBluez, "tetherlock.bluez", QtInfoMsg)

const QString g_kService{ QStringLiteral("org.bluez") };
const QString g_kDeviceInterface{ QStringLiteral("org.bluez.Device1") };
const QString g_kPropertiesInterface{ QStringLiteral("org.freedesktop.DBus.Properties") };
const QString g_kObjectManagerInterface{ QStringLiteral("org.freedesktop.DBus.ObjectManager") };

// Probe calls run on every tick and must stay bounded.
constexpr int g_kProbeTimeoutMs{ 2000 };
constexpr int g_kConnectTimeoutMs{ 15000 };

struct CachedDevice final
{
    QString objectPath;
    std::string name;
    bool connected{ false };
};

class BluezPresenceSource final : public tetherlock::device::IDevicePresenceSource
{
public:
    BluezPresenceSource() : m_bus(QDBusConnection::systemBus())
    {
        qDBusRegisterMetaType<BluezInterfaceMap>();
        qDBusRegisterMetaType<BluezManagedObjects>();
    }

    [[nodiscard]] std::vector<DeviceHandle> discover() override
    {
        requireBluez();

        const auto scan{ scanObjects() };
        if (!scan.hasAdapter)
        {
            throw ProbeUnavailable{ "no Bluetooth adapter is registered with BlueZ" };
        }

        std::vector<DeviceHandle> out{};
        std::map<std::string, CachedDevice> found{};
        for (const auto& paired : scan.devices)
        {
            found.emplace(paired.address, CachedDevice{ paired.objectPath, paired.name, paired.connected });
            out.push_back(DeviceHandle{ paired.address });
        }

        qCDebug(lcBluez) << "discovered" << out.size() << "paired device(s)";

        std::scoped_lock lock{ m_mutex };
        m_devices = std::move(found);
        return out;
    }

    void refresh(const DeviceHandle& device) override
    {
        const auto path{ objectPathOf(device) };

        auto call{ QDBusMessage::createMethodCall(g_kService, path, g_kPropertiesInterface, QStringLiteral("GetAll")) };
        call << g_kDeviceInterface;
        const auto reply{ m_bus.call(call, QDBus::Block, g_kProbeTimeoutMs) };
        if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty())
        {
            // The device object also disappears when its adapter is removed.
            if (QDBusError{ reply }.type() == QDBusError::UnknownObject && !scanObjects().hasAdapter)
            {
                throw ProbeUnavailable{ "the Bluetooth adapter was removed" };
            }
            throwCallFailure(reply, "refresh " + device.address);
        }

        const auto props{ qdbus_cast<QVariantMap>(reply.arguments().constFirst()) };

        std::scoped_lock lock{ m_mutex };
        const auto it{ m_devices.find(device.address) };
        if (it == m_devices.end())
        {
            throw TransientProbeFailure{ "device " + device.address + " vanished during refresh" };
        }
        auto& cached{ it->second };
        cached.connected = props.value(QStringLiteral("Connected")).toBool();
        if (auto name{ nameFrom(props) }; !name.empty())
        {
            cached.name = std::move(name);
        }
    }

    [[nodiscard]] bool isConnected(const DeviceHandle& device) const override
    {
        std::scoped_lock lock{ m_mutex };
        return cachedOf(device).connected;
    }

    [[nodiscard]] std::string name(const DeviceHandle& device) const override
    {
        std::scoped_lock lock{ m_mutex };
        return cachedOf(device).name;
    }

    void attemptConnect(const DeviceHandle& device) override
    {
        const auto path{ objectPathOf(device) };

        auto call{ QDBusMessage::createMethodCall(g_kService, path, g_kDeviceInterface, QStringLiteral("Connect")) };
        const auto reply{ m_bus.call(call, QDBus::Block, g_kConnectTimeoutMs) };
        if (reply.type() != QDBusMessage::ReplyMessage)
        {
            throwCallFailure(reply, "connect " + device.address);
        }
        qCDebug(lcBluez) << "connect request accepted for" << QString::fromStdString(device.address);
    }

private:
    [[nodiscard]] ManagedObjectsScan scanObjects() const
    {
        auto call{ QDBusMessage::createMethodCall(g_kService, QStringLiteral("/"), g_kObjectManagerInterface,
                                                  QStringLiteral("GetManagedObjects")) };
        const auto reply{ m_bus.call(call, QDBus::Block, g_kProbeTimeoutMs) };
        if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty())
        {
            throwCallFailure(reply, "GetManagedObjects");
        }
        return scanManagedObjects(qdbus_cast<BluezManagedObjects>(reply.arguments().constFirst()));
    }

    void requireBluez() const
    {
        if (!m_bus.isConnected())
        {
            throw ProbeUnavailable{ "system D-Bus is not reachable: " + m_bus.lastError().message().toStdString() };
        }

        const auto* busInterface{ m_bus.interface() };
        if (busInterface == nullptr || !busInterface->isServiceRegistered(g_kService).value())
        {
            throw ProbeUnavailable{ "BlueZ (org.bluez) is not running on the system bus" };
        }
    }

    [[nodiscard]] const CachedDevice& cachedOf(const DeviceHandle& device) const
    {
        const auto it{ m_devices.find(device.address) };
        if (it == m_devices.end())
        {
            throw TransientProbeFailure{ "unknown device " + device.address };
        }
        return it->second;
    }

    [[nodiscard]] QString objectPathOf(const DeviceHandle& device) const
    {
        std::scoped_lock lock{ m_mutex };
        return cachedOf(device).objectPath;
    }

    QDBusConnection m_bus;
    mutable std::mutex m_mutex;
    std::map<std::string, CachedDevice> m_devices;
};

} // namespace

std::unique_ptr<tetherlock::device::IDevicePresenceSource> makeBluezPresenceSource()
{
    return std::make_unique<BluezPresenceSource>();
}

} // namespace tetherlock::device::bluez
