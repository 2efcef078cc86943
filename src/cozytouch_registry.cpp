#include "cozytouch_registry.h"

#include <algorithm>

#include <QReadLocker>
#include <QWriteLocker>

#include "cozytouch_log.h"

namespace phicore::cozytouch {

namespace {

struct BinaryConfig {
    const char *deviceClass;
    QStringList onValues;
};

struct SensorConfig {
    const char *deviceClass;
    const char *unit;
    const char *stateClass;
};

const QStringList &defaultOnValues()
{
    static const QStringList values = {QStringLiteral("on"), QStringLiteral("true"), QStringLiteral("1")};
    return values;
}

const QHash<QString, BinaryConfig> &binaryStates()
{
    static const QHash<QString, BinaryConfig> table = {
        {QStringLiteral("core:OnOffState"), {"power", defaultOnValues()}},
        {QStringLiteral("core:BoostOnOffState"), {"running", defaultOnValues()}},
        {QStringLiteral("core:DHWOnOffState"), {"running", defaultOnValues()}},
        {QStringLiteral("io:DHWBoostModeState"), {"running", defaultOnValues()}},
        {QStringLiteral("core:HeatingOnOffState"), {"heat", defaultOnValues()}},
        {QStringLiteral("core:CoolingOnOffState"), {"cold", defaultOnValues()}},
        {QStringLiteral("io:ElectricBoosterOperatingModeState"),
         {"running", defaultOnValues() + QStringList{QStringLiteral("active")}}},
        {QStringLiteral("core:OperatingModeState"),
         {"", defaultOnValues() + QStringList{QStringLiteral("heating"), QStringLiteral("cooling")}}},
        {QStringLiteral("core:StatusState"),
         {"running", QStringList{QStringLiteral("available")} + defaultOnValues()}},
    };
    return table;
}

const QHash<QString, SensorConfig> &sensorStates()
{
    static const QHash<QString, SensorConfig> table = {
        {QStringLiteral("core:TemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:TargetTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:ComfortTargetDHWTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:EcoTargetDHWTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:TargetDHWTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:WaterTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:OutdoorTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("io:MiddleWaterTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("io:OutletWaterTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("io:InletWaterTemperatureState"), {"temperature", "°C", "measurement"}},
        {QStringLiteral("core:ElectricPowerConsumptionState"), {"power", "W", "measurement"}},
        {QStringLiteral("core:ElectricEnergyConsumptionState"), {"energy", "Wh", "total_increasing"}},
        {QStringLiteral("io:ElectricBoosterOperatingTimeState"), {"duration", "h", "total_increasing"}},
        {QStringLiteral("io:HeatPumpOperatingTimeState"), {"duration", "h", "total_increasing"}},
        {QStringLiteral("core:RelativeHumidityState"), {"humidity", "%", "measurement"}},
    };
    return table;
}

bool looksBinary(const StateValue &value)
{
    if (std::holds_alternative<bool>(value))
        return true;
    if (const auto *s = std::get_if<QString>(&value)) {
        const QString text = s->trimmed().toLower();
        return text == QLatin1String("on") || text == QLatin1String("off")
            || text == QLatin1String("true") || text == QLatin1String("false");
    }
    return false;
}

QString sanitizedDeviceId(const QString &deviceId)
{
    QString out = deviceId;
    out.replace(QLatin1Char('/'), QLatin1Char('_'));
    out.replace(QLatin1Char(':'), QLatin1Char('_'));
    out.replace(QLatin1Char('#'), QLatin1Char('_'));
    return out;
}

QString deviceLabelFor(const DiscoveryBatch &batch, const QString &deviceId)
{
    if (batch.snapshot) {
        const auto it = batch.snapshot->devices.constFind(deviceId);
        if (it != batch.snapshot->devices.constEnd() && !it->label.isEmpty())
            return it->label;
    }
    return deviceId;
}

} // namespace

const char *entityKindName(EntityKind kind)
{
    switch (kind) {
    case EntityKind::Sensor:
        return "sensor";
    case EntityKind::BinarySensor:
        return "binary_sensor";
    }
    return "unknown";
}

EntityDescriptor describeEntity(const QString &deviceId,
                                const QString &deviceLabel,
                                const QString &field,
                                const StateValue &firstValue)
{
    EntityDescriptor out;
    const QString label = deviceLabel.isEmpty() ? deviceId : deviceLabel;
    out.name = label + QLatin1Char(' ') + fieldDisplayName(field);
    const QString safeField = QString(field).replace(QLatin1Char(':'), QLatin1Char('_'));
    out.uniqueId = sanitizedDeviceId(deviceId) + QLatin1Char('_') + safeField;

    const auto binary = binaryStates().constFind(field);
    if (binary != binaryStates().constEnd() || looksBinary(firstValue)) {
        out.kind = EntityKind::BinarySensor;
        out.uniqueId += QStringLiteral("_binary");
        if (binary != binaryStates().constEnd()) {
            out.deviceClass = QString::fromLatin1(binary->deviceClass);
            out.onValues = binary->onValues;
        } else {
            out.onValues = defaultOnValues();
        }
        return out;
    }

    out.kind = EntityKind::Sensor;
    const auto sensor = sensorStates().constFind(field);
    if (sensor != sensorStates().constEnd()) {
        out.deviceClass = QString::fromLatin1(sensor->deviceClass);
        out.unit = QString::fromUtf8(sensor->unit);
        out.stateClass = QString::fromLatin1(sensor->stateClass);
    } else {
        out.unit = inferUnitHint(field);
    }
    return out;
}

bool isOnValue(const EntityDescriptor &descriptor, const StateValue &value)
{
    const QString text = stateValueToString(value).trimmed().toLower();
    const QStringList &onValues = descriptor.onValues.isEmpty() ? defaultOnValues() : descriptor.onValues;
    return onValues.contains(text);
}

EntityRegistry::EntityRegistry(QObject *parent)
    : QObject(parent)
{
}

bool EntityRegistry::applyBatch(const DiscoveryBatch &batch, QString *error)
{
    QList<Notification> notifications;
    {
        QWriteLocker locker(&m_lock);
        for (const DiscoveryEvent &event : batch.events) {
            const auto found = m_index.constFind(event.key);
            if (found == m_index.constEnd()) {
                RegistryEntry created;
                created.key = event.key;
                created.handle = static_cast<int>(m_entries.size());
                created.descriptor = describeEntity(event.key.deviceId,
                                                    deviceLabelFor(batch, event.key.deviceId),
                                                    event.key.field,
                                                    event.value);
                created.lastValue = event.value;
                created.firstSeenMs = event.timestampMs;
                created.lastSeenMs = event.timestampMs;
                created.lastChangedMs = event.timestampMs;
                created.lastSequence = batch.sequence;
                created.available = event.classification != Classification::Missing;

                m_index.insert(created.key, created.handle);
                notifications.append({Notification::Created, created.handle, created.available});
                qCDebug(registryLog).noquote() << "Created" << entityKindName(created.descriptor.kind)
                                               << created.descriptor.uniqueId;
                m_entries.push_back(std::move(created));
                continue;
            }

            RegistryEntry &entry = m_entries[static_cast<std::size_t>(*found)];
            if (batch.sequence < entry.lastSequence)
                continue;
            entry.lastSequence = batch.sequence;

            if (event.classification == Classification::Missing) {
                if (entry.available) {
                    entry.available = false;
                    notifications.append({Notification::Availability, entry.handle, false});
                }
                continue;
            }

            entry.lastSeenMs = std::max(entry.lastSeenMs, event.timestampMs);
            if (!(entry.lastValue == event.value)) {
                entry.lastValue = event.value;
                entry.lastChangedMs = std::max(entry.lastChangedMs, event.timestampMs);
                notifications.append({Notification::Updated, entry.handle, entry.available});
            }
            if (!entry.available) {
                entry.available = true;
                notifications.append({Notification::Availability, entry.handle, true});
            }
        }

        // Unchanged keys are not in the event list; they were still seen.
        if (batch.snapshot) {
            for (const Device &device : batch.snapshot->devices) {
                for (const StateEntry &state : device.states) {
                    const auto found = m_index.constFind(DiscoveryKey{device.id, state.name});
                    if (found == m_index.constEnd())
                        continue;
                    RegistryEntry &entry = m_entries[static_cast<std::size_t>(*found)];
                    if (batch.sequence < entry.lastSequence)
                        continue;
                    entry.lastSequence = batch.sequence;
                    entry.lastSeenMs = std::max(entry.lastSeenMs, batch.timestampMs);
                }
            }
        }
    }

    for (const Notification &notification : std::as_const(notifications)) {
        switch (notification.kind) {
        case Notification::Created:
            emit entityCreated(notification.handle);
            break;
        case Notification::Updated:
            emit entityUpdated(notification.handle);
            break;
        case Notification::Availability:
            emit availabilityChanged(notification.handle, notification.available);
            break;
        }
    }

    if (error)
        error->clear();
    return true;
}

std::optional<RegistryEntry> EntityRegistry::entry(const DiscoveryKey &key) const
{
    QReadLocker locker(&m_lock);
    const auto found = m_index.constFind(key);
    if (found == m_index.constEnd())
        return std::nullopt;
    return m_entries[static_cast<std::size_t>(*found)];
}

std::optional<RegistryEntry> EntityRegistry::entryByHandle(int handle) const
{
    QReadLocker locker(&m_lock);
    if (handle < 0 || handle >= static_cast<int>(m_entries.size()))
        return std::nullopt;
    return m_entries[static_cast<std::size_t>(handle)];
}

QList<RegistryEntry> EntityRegistry::entries() const
{
    QReadLocker locker(&m_lock);
    QList<RegistryEntry> out;
    out.reserve(static_cast<qsizetype>(m_entries.size()));
    for (const RegistryEntry &entry : m_entries)
        out.append(entry);
    return out;
}

QList<RegistryEntry> EntityRegistry::entriesForDevice(const QString &deviceId) const
{
    QReadLocker locker(&m_lock);
    QList<RegistryEntry> out;
    for (const RegistryEntry &entry : m_entries) {
        if (entry.key.deviceId == deviceId)
            out.append(entry);
    }
    std::sort(out.begin(), out.end(), [](const RegistryEntry &lhs, const RegistryEntry &rhs) {
        return lhs.key < rhs.key;
    });
    return out;
}

QList<DiscoveryKey> EntityRegistry::knownKeys() const
{
    QReadLocker locker(&m_lock);
    QList<DiscoveryKey> keys;
    keys.reserve(static_cast<qsizetype>(m_entries.size()));
    for (const RegistryEntry &entry : m_entries)
        keys.append(entry.key);
    std::sort(keys.begin(), keys.end());
    return keys;
}

int EntityRegistry::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_entries.size());
}

int EntityRegistry::availableCount() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(std::count_if(m_entries.begin(), m_entries.end(), [](const RegistryEntry &entry) {
        return entry.available;
    }));
}

} // namespace phicore::cozytouch
