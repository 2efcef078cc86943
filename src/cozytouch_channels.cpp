#include "cozytouch_channels.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::cozytouch::ipc {

namespace {

namespace v1 = phicore::adapter::v1;

v1::ChannelKind channelKindFor(const EntityDescriptor &descriptor)
{
    if (descriptor.kind == EntityKind::BinarySensor)
        return descriptor.deviceClass == QLatin1String("power") ? v1::ChannelKind::PowerOnOff : v1::ChannelKind::Unknown;
    if (descriptor.deviceClass == QLatin1String("temperature"))
        return v1::ChannelKind::Temperature;
    if (descriptor.deviceClass == QLatin1String("humidity"))
        return v1::ChannelKind::Humidity;
    if (descriptor.deviceClass == QLatin1String("power"))
        return v1::ChannelKind::Power;
    if (descriptor.deviceClass == QLatin1String("energy"))
        return v1::ChannelKind::Energy;
    if (descriptor.deviceClass == QLatin1String("duration"))
        return v1::ChannelKind::Duration;
    return v1::ChannelKind::Unknown;
}

v1::ChannelDataType channelDataTypeFor(const RegistryEntry &entry)
{
    if (entry.descriptor.kind == EntityKind::BinarySensor)
        return v1::ChannelDataType::Bool;
    if (std::holds_alternative<std::int64_t>(entry.lastValue))
        return v1::ChannelDataType::Int;
    if (std::holds_alternative<double>(entry.lastValue))
        return v1::ChannelDataType::Float;
    if (std::holds_alternative<bool>(entry.lastValue))
        return v1::ChannelDataType::Bool;
    // Overkiz string states are mode names; free-form text and opaque values
    // travel the same way.
    return v1::ChannelDataType::Enum;
}

QString firmwareOf(const Device &device)
{
    static const char *const keys[] = {"core:FirmwareRevision", "core:SoftwareVersion", "core:Firmware"};
    for (const char *key : keys) {
        const auto it = device.attributes.constFind(QString::fromLatin1(key));
        if (it != device.attributes.constEnd())
            return stateValueToString(it.value());
    }
    return {};
}

} // namespace

v1::ScalarValue toScalarValue(const RegistryEntry &entry, const StateValue &value)
{
    if (entry.descriptor.kind == EntityKind::BinarySensor)
        return isOnValue(entry.descriptor, value);
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return *i;
    if (const auto *d = std::get_if<double>(&value))
        return *d;
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    return stateValueToString(value).toStdString();
}

v1::Channel makeStateChannel(const RegistryEntry &entry)
{
    v1::Channel channel;
    channel.externalId = entry.key.field.toStdString();
    channel.name = fieldDisplayName(entry.key.field).toStdString();
    channel.kind = channelKindFor(entry.descriptor);
    channel.dataType = channelDataTypeFor(entry);
    channel.flags = v1::kChannelFlagDefaultRead;
    if (!entry.descriptor.unit.isEmpty())
        channel.unit = entry.descriptor.unit.toStdString();

    QJsonObject meta;
    meta.insert(QStringLiteral("stateName"), entry.key.field);
    meta.insert(QStringLiteral("uniqueId"), entry.descriptor.uniqueId);
    meta.insert(QStringLiteral("entityKind"), QString::fromLatin1(entityKindName(entry.descriptor.kind)));
    meta.insert(QStringLiteral("valueType"), QString::fromLatin1(stateValueTypeName(entry.lastValue)));
    if (!entry.descriptor.deviceClass.isEmpty())
        meta.insert(QStringLiteral("deviceClass"), entry.descriptor.deviceClass);
    if (!entry.descriptor.stateClass.isEmpty())
        meta.insert(QStringLiteral("stateClass"), entry.descriptor.stateClass);
    if (!entry.available)
        meta.insert(QStringLiteral("available"), false);
    channel.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();

    if (entry.available) {
        channel.hasValue = true;
        channel.lastValue = toScalarValue(entry, entry.lastValue);
    }
    return channel;
}

DeviceEntry buildDeviceEntry(const QString &deviceId, const Device *device, const QList<RegistryEntry> &entries)
{
    DeviceEntry out;
    out.device.externalId = deviceId.toStdString();
    out.device.deviceClass = v1::DeviceClass::Sensor;
    out.device.manufacturer = "Atlantic";

    QJsonObject meta;
    meta.insert(QStringLiteral("deviceUrl"), deviceId);
    if (device) {
        out.device.name = (device->label.isEmpty() ? deviceId : device->label).toStdString();
        out.device.model = device->uiClass.isEmpty()
            ? device->widget.toStdString()
            : QStringLiteral("%1 (%2)").arg(device->widget, device->uiClass).toStdString();
        out.device.firmware = firmwareOf(*device).toStdString();

        meta.insert(QStringLiteral("controllableName"), device->typeLabel);
        meta.insert(QStringLiteral("widget"), device->widget);
        meta.insert(QStringLiteral("uiClass"), device->uiClass);
        meta.insert(QStringLiteral("protocol"), device->protocol);
        meta.insert(QStringLiteral("available"), device->available);
        meta.insert(QStringLiteral("commands"), QJsonArray::fromStringList(device->commands));
        if (!device->parseError.isEmpty())
            meta.insert(QStringLiteral("parseError"), device->parseError);
    } else {
        out.device.name = deviceId.toStdString();
        meta.insert(QStringLiteral("available"), false);
    }
    out.device.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();

    for (const RegistryEntry &entry : entries)
        out.channels.push_back(makeStateChannel(entry));
    return out;
}

} // namespace phicore::cozytouch::ipc
