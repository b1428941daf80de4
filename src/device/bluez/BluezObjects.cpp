#include "BluezObjects.hpp"

#include "tetherlock/device/DeviceErrors.hpp"
#include <QDBusError>
#include <set>
#include <utility>

namespace tetherlock::device::bluez
{
namespace
{

const QString g_kAdapterInterface{ QStringLiteral("org.bluez.Adapter1") };
const QString g_kDeviceInterface{ QStringLiteral("org.bluez.Device1") };

} // namespace

ManagedObjectsScan scanManagedObjects(const BluezManagedObjects& objects)
{
    ManagedObjectsScan out{};
    std::set<std::string> seen{};
    for (auto it{ objects.constBegin() }; it != objects.constEnd(); ++it)
    {
        const auto& interfaces{ it.value() };
        if (interfaces.contains(g_kAdapterInterface))
        {
            out.hasAdapter = true;
        }

        const auto device{ interfaces.constFind(g_kDeviceInterface) };
        if (device == interfaces.constEnd())
        {
            continue;
        }

        const auto& props{ device.value() };
        if (!props.value(QStringLiteral("Paired")).toBool())
        {
            continue;
        }

        auto address{ props.value(QStringLiteral("Address")).toString().toStdString() };
        if (address.empty() || !seen.insert(address).second)
        {
            continue;
        }

        PairedDevice paired{};
        paired.address = std::move(address);
        paired.objectPath = it.key().path();
        paired.name = nameFrom(props);
        paired.connected = props.value(QStringLiteral("Connected")).toBool();
        out.devices.push_back(std::move(paired));
    }
    return out;
}

std::string nameFrom(const QVariantMap& props)
{
    for (const auto* key : { "Alias", "Name" })
    {
        const auto it{ props.constFind(QString::fromLatin1(key)) };
        if (it != props.constEnd() && !it->toString().isEmpty())
        {
            return it->toString().toStdString();
        }
    }
    return {};
}

bool isServiceGone(const QDBusMessage& reply)
{
    switch (QDBusError{ reply }.type())
    {
    case QDBusError::ServiceUnknown:
    case QDBusError::Disconnected:
    case QDBusError::NoServer:
        return true;
    default:
        return false;
    }
}

void throwCallFailure(const QDBusMessage& reply, const std::string& context)
{
    const auto what{ context + ": " + reply.errorName().toStdString() + ": " + reply.errorMessage().toStdString() };
    if (isServiceGone(reply))
    {
        throw ProbeUnavailable{ what };
    }
    throw TransientProbeFailure{ what };
}

} // namespace tetherlock::device::bluez
