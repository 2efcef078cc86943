#include "cozytouch_diagnostics.h"

#include <algorithm>

#include <QDateTime>
#include <QJsonArray>

#include "cozytouch_coordinator.h"
#include "cozytouch_events.h"
#include "cozytouch_log.h"
#include "cozytouch_registry.h"

namespace phicore::cozytouch {

namespace {

QJsonObject deviceToJson(const Device &device)
{
    QJsonObject states;
    for (const StateEntry &state : device.states) {
        QJsonObject entry = taggedStateValue(state.value);
        if (state.dataType != 0)
            entry.insert(QStringLiteral("data_type"), state.dataType);
        if (!state.unitHint.isEmpty())
            entry.insert(QStringLiteral("unit"), state.unitHint);
        states.insert(state.name, entry);
    }

    QJsonObject attributes;
    for (auto it = device.attributes.constBegin(); it != device.attributes.constEnd(); ++it)
        attributes.insert(it.key(), taggedStateValue(it.value()));

    QJsonObject out;
    out.insert(QStringLiteral("label"), device.label);
    out.insert(QStringLiteral("controllable_name"), device.typeLabel);
    out.insert(QStringLiteral("widget"), device.widget);
    out.insert(QStringLiteral("ui_class"), device.uiClass);
    out.insert(QStringLiteral("protocol"), device.protocol);
    out.insert(QStringLiteral("available"), device.available);
    out.insert(QStringLiteral("enabled"), device.enabled);
    out.insert(QStringLiteral("states"), states);
    out.insert(QStringLiteral("attributes"), attributes);
    out.insert(QStringLiteral("commands"), QJsonArray::fromStringList(device.commands));
    out.insert(QStringLiteral("state_definitions"), QJsonArray::fromStringList(device.stateDefinitions));
    out.insert(QStringLiteral("raw_data"), redactSecrets(device.raw));
    if (!device.parseError.isEmpty())
        out.insert(QStringLiteral("parse_error"), device.parseError);
    return out;
}

QJsonObject eventToJson(const RemoteEvent &event)
{
    QJsonObject out;
    out.insert(QStringLiteral("sequence"), static_cast<qint64>(event.sequence));
    out.insert(QStringLiteral("timestamp_ms"), static_cast<qint64>(event.timestampMs));
    out.insert(QStringLiteral("device_id"), event.deviceId);
    out.insert(QStringLiteral("name"), event.name);
    out.insert(QStringLiteral("payload"), redactSecrets(event.payload));
    return out;
}

QJsonObject entryToJson(const RegistryEntry &entry)
{
    QJsonObject out;
    out.insert(QStringLiteral("device_id"), entry.key.deviceId);
    out.insert(QStringLiteral("field"), entry.key.field);
    out.insert(QStringLiteral("handle"), entry.handle);
    out.insert(QStringLiteral("entity_kind"), QString::fromLatin1(entityKindName(entry.descriptor.kind)));
    out.insert(QStringLiteral("unique_id"), entry.descriptor.uniqueId);
    out.insert(QStringLiteral("name"), entry.descriptor.name);
    if (!entry.descriptor.deviceClass.isEmpty())
        out.insert(QStringLiteral("device_class"), entry.descriptor.deviceClass);
    if (!entry.descriptor.unit.isEmpty())
        out.insert(QStringLiteral("unit"), entry.descriptor.unit);
    out.insert(QStringLiteral("available"), entry.available);
    out.insert(QStringLiteral("first_seen_ms"), static_cast<qint64>(entry.firstSeenMs));
    out.insert(QStringLiteral("last_seen_ms"), static_cast<qint64>(entry.lastSeenMs));
    out.insert(QStringLiteral("last_changed_ms"), static_cast<qint64>(entry.lastChangedMs));
    out.insert(QStringLiteral("last_value"), taggedStateValue(entry.lastValue));
    return out;
}

} // namespace

DiagnosticsExporter::DiagnosticsExporter(const DiscoveryCoordinator *coordinator,
                                         const EventTracker *tracker,
                                         const EntityRegistry *registry)
    : m_coordinator(coordinator)
    , m_tracker(tracker)
    , m_registry(registry)
{
}

void DiagnosticsExporter::setConfig(const CozytouchConfig &config)
{
    m_config = config;
    m_hasConfig = true;
}

QJsonObject DiagnosticsExporter::exportDocument() const
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const SnapshotPtr snapshot = m_coordinator ? m_coordinator->currentSnapshot() : SnapshotPtr();

    QJsonObject devices;
    QJsonArray gateways;
    int commandCount = 0;
    if (snapshot) {
        for (const Device &device : snapshot->devices) {
            devices.insert(device.id, deviceToJson(device));
            commandCount += device.commands.size();
        }
        for (const Gateway &gateway : snapshot->gateways) {
            QJsonObject entry;
            entry.insert(QStringLiteral("gateway_id"), gateway.id);
            entry.insert(QStringLiteral("alive"), gateway.alive);
            entry.insert(QStringLiteral("raw_data"), redactSecrets(gateway.raw));
            gateways.append(entry);
        }
    }

    QJsonArray events;
    if (m_tracker) {
        const QList<RemoteEvent> recent = m_tracker->recent();
        for (const RemoteEvent &event : recent)
            events.append(eventToJson(event));
    }

    QJsonArray knownKeys;
    int availableKeys = 0;
    if (m_registry) {
        QList<RegistryEntry> entries = m_registry->entries();
        std::sort(entries.begin(), entries.end(), [](const RegistryEntry &lhs, const RegistryEntry &rhs) {
            return lhs.key < rhs.key;
        });
        for (const RegistryEntry &entry : std::as_const(entries)) {
            knownKeys.append(entryToJson(entry));
            if (entry.available)
                ++availableKeys;
        }
    }

    QJsonObject summary;
    summary.insert(QStringLiteral("device_count"), devices.size());
    summary.insert(QStringLiteral("gateway_count"), gateways.size());
    summary.insert(QStringLiteral("state_count"), snapshot ? snapshot->stateCount() : 0);
    summary.insert(QStringLiteral("command_count"), commandCount);
    summary.insert(QStringLiteral("known_key_count"), knownKeys.size());
    summary.insert(QStringLiteral("available_key_count"), availableKeys);
    summary.insert(QStringLiteral("event_count"), events.size());
    summary.insert(QStringLiteral("events_recorded_total"),
                   static_cast<qint64>(m_tracker ? m_tracker->totalRecorded() : 0));
    summary.insert(QStringLiteral("snapshot_sequence"), static_cast<qint64>(snapshot ? snapshot->sequence : 0));
    summary.insert(QStringLiteral("snapshot_timestamp_ms"), static_cast<qint64>(snapshot ? snapshot->timestampMs : 0));

    QJsonObject doc;
    doc.insert(QStringLiteral("generated_at"), now.toString(Qt::ISODateWithMs));
    doc.insert(QStringLiteral("summary"), summary);
    if (m_hasConfig)
        doc.insert(QStringLiteral("config"), m_config.toRedactedJson());
    if (m_coordinator)
        doc.insert(QStringLiteral("coordinator"), m_coordinator->status().toJson());
    doc.insert(QStringLiteral("gateways"), gateways);
    doc.insert(QStringLiteral("devices"), devices);
    doc.insert(QStringLiteral("events"), events);
    doc.insert(QStringLiteral("known_keys"), knownKeys);

    qCInfo(diagnosticsLog) << "Generated diagnostics:" << devices.size() << "devices,"
                           << gateways.size() << "gateways," << events.size() << "events,"
                           << knownKeys.size() << "known keys";
    return doc;
}

QByteArray DiagnosticsExporter::exportJson(QJsonDocument::JsonFormat format) const
{
    return QJsonDocument(exportDocument()).toJson(format);
}

} // namespace phicore::cozytouch
