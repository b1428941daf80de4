#ifndef SRC_DEVICE_BLUEZ_BLUEZOBJECTS_HPP
#define SRC_DEVICE_BLUEZ_BLUEZOBJECTS_HPP

#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QVariantMap>
#include <string>
#include <vector>

using BluezInterfaceMap = QMap<QString, QVariantMap>;
using BluezManagedObjects = QMap<QDBusObjectPath, BluezInterfaceMap>;
Q_DECLARE_METATYPE(BluezInterfaceMap)
Q_DECLARE_METATYPE(BluezManagedObjects)

namespace tetherlock::device::bluez
{

struct PairedDevice final
{
    std::string address;
    QString objectPath;
    std::string name;
    bool connected{ false };
};

struct ManagedObjectsScan final
{
    bool hasAdapter{ false };
    // One entry per address; a device paired on several adapters keeps its first object path.
    std::vector<PairedDevice> devices;
};

// Paired org.bluez.Device1 objects with an address, in object path order.
[[nodiscard]] ManagedObjectsScan scanManagedObjects(const BluezManagedObjects& objects);

// Alias, falling back to Name.
[[nodiscard]] std::string nameFrom(const QVariantMap& props);

// True when the error reply means BlueZ or the bus itself is gone, not just one call.
[[nodiscard]] bool isServiceGone(const QDBusMessage& reply);

// Throws ProbeUnavailable when isServiceGone(reply), otherwise TransientProbeFailure.
[[noreturn]] void throwCallFailure(const QDBusMessage& reply, const std::string& context);

} // namespace tetherlock::device::bluez

#endif // SRC_DEVICE_BLUEZ_BLUEZOBJECTS_HPP
