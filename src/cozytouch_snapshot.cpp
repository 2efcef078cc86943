#include "cozytouch_snapshot.h"

#include <utility>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "cozytouch_log.h"

namespace phicore::cozytouch {

namespace {

QString syntheticDeviceId(int index)
{
    return QStringLiteral("unidentified#%1").arg(index);
}

QString protocolFromDeviceUrl(const QString &deviceUrl)
{
    const int sep = deviceUrl.indexOf(QLatin1String("://"));
    if (sep <= 0)
        return {};
    return deviceUrl.left(sep);
}

QString firstString(const QJsonObject &primary, const QJsonObject &fallback, const QString &key, const QString &fallbackKey)
{
    const QString value = primary.value(key).toString().trimmed();
    if (!value.isEmpty())
        return value;
    return fallback.value(fallbackKey).toString().trimmed();
}

void readAttributes(const QJsonValue &value, Device *device)
{
    if (!value.isArray())
        return;
    for (const QJsonValue &entry : value.toArray()) {
        const QJsonObject attrObj = entry.toObject();
        const QString name = attrObj.value(QStringLiteral("name")).toString().trimmed();
        if (name.isEmpty())
            continue;
        device->attributes.insert(name,
                                  stateValueFromJson(attrObj.value(QStringLiteral("value")),
                                                     attrObj.value(QStringLiteral("type")).toInt(0)));
    }
}

void readDefinition(const QJsonObject &definition, Device *device)
{
    for (const QJsonValue &entry : definition.value(QStringLiteral("commands")).toArray()) {
        const QString name = entry.toObject().value(QStringLiteral("commandName")).toString().trimmed();
        if (!name.isEmpty())
            device->commands.append(name);
    }
    device->commands.sort();
    device->commands.removeDuplicates();

    for (const QJsonValue &entry : definition.value(QStringLiteral("states")).toArray()) {
        const QString name = entry.toObject().value(QStringLiteral("qualifiedName")).toString().trimmed();
        if (!name.isEmpty())
            device->stateDefinitions.append(name);
    }
}

bool readStates(const QJsonValue &value, Device *device, QString *error)
{
    if (value.isUndefined() || value.isNull())
        return true;
    if (!value.isArray()) {
        if (error)
            *error = QStringLiteral("states is not an array");
        return false;
    }

    const QJsonArray states = value.toArray();
    for (int i = 0; i < states.size(); ++i) {
        const QJsonValue entry = states.at(i);
        if (!entry.isObject()) {
            if (error)
                *error = QStringLiteral("state #%1 is not an object").arg(i);
            return false;
        }
        const QJsonObject stateObj = entry.toObject();
        const QString name = stateObj.value(QStringLiteral("name")).toString().trimmed();
        if (name.isEmpty()) {
            if (error)
                *error = QStringLiteral("state #%1 has no name").arg(i);
            return false;
        }

        StateEntry state;
        state.name = name;
        state.dataType = stateObj.value(QStringLiteral("type")).toInt(0);
        state.value = stateValueFromJson(stateObj.value(QStringLiteral("value")), state.dataType);
        state.unitHint = inferUnitHint(name);

        bool replaced = false;
        for (StateEntry &existing : device->states) {
            if (existing.name != name)
                continue;
            existing = state;
            replaced = true;
            break;
        }
        if (!replaced)
            device->states.append(std::move(state));
    }
    return true;
}

Gateway parseGateway(const QJsonObject &gatewayObj)
{
    Gateway gateway;
    gateway.id = gatewayObj.value(QStringLiteral("gatewayId")).toString().trimmed();
    gateway.alive = gatewayObj.value(QStringLiteral("alive")).toBool(false);
    gateway.raw = gatewayObj;
    return gateway;
}

} // namespace

bool parseDeviceRecord(const QJsonValue &record, int index, Device *out, QString *error)
{
    if (!out)
        return false;

    *out = Device{};
    if (!record.isObject()) {
        out->id = syntheticDeviceId(index);
        out->raw.insert(QStringLiteral("invalidRecord"), record);
        out->parseError = QStringLiteral("device record is not an object");
        if (error)
            *error = out->parseError;
        return false;
    }

    const QJsonObject deviceObj = record.toObject();
    const QJsonObject definition = deviceObj.value(QStringLiteral("definition")).toObject();

    out->raw = deviceObj;
    out->id = deviceObj.value(QStringLiteral("deviceURL")).toString().trimmed();
    if (out->id.isEmpty())
        out->id = syntheticDeviceId(index);
    out->label = deviceObj.value(QStringLiteral("label")).toString().trimmed();
    out->typeLabel = deviceObj.value(QStringLiteral("controllableName")).toString().trimmed();
    out->widget = firstString(deviceObj, definition, QStringLiteral("widget"), QStringLiteral("widgetName"));
    out->uiClass = firstString(deviceObj, definition, QStringLiteral("uiClass"), QStringLiteral("uiClass"));
    out->protocol = protocolFromDeviceUrl(out->id);
    out->available = deviceObj.value(QStringLiteral("available")).toBool(true);
    out->enabled = deviceObj.value(QStringLiteral("enabled")).toBool(true);

    readAttributes(deviceObj.value(QStringLiteral("attributes")), out);
    readDefinition(definition, out);

    QString stateError;
    if (!readStates(deviceObj.value(QStringLiteral("states")), out, &stateError)) {
        out->states.clear();
        out->parseError = stateError;
        if (error)
            *error = stateError;
        return false;
    }

    if (error)
        error->clear();
    return true;
}

bool SnapshotBuilder::build(const QByteArray &payload,
                            std::int64_t timestampMs,
                            Snapshot *out,
                            QString *error)
{
    QJsonParseError parseError;
    bool repaired = false;
    const QJsonDocument doc = parseJsonPayload(payload, &parseError, &repaired);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("Setup payload is not valid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (repaired)
        qCWarning(coordinatorLog) << "Setup payload contains invalid UTF-8; replaced with U+FFFD";

    const QJsonValue root = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
    return build(root, timestampMs, out, error);
}

bool SnapshotBuilder::build(const QJsonValue &root,
                            std::int64_t timestampMs,
                            Snapshot *out,
                            QString *error)
{
    if (!out)
        return false;

    QJsonArray deviceRecords;
    QJsonArray gatewayRecords;
    if (root.isArray()) {
        deviceRecords = root.toArray();
    } else if (root.isObject()) {
        const QJsonValue devices = root.toObject().value(QStringLiteral("devices"));
        if (!devices.isArray()) {
            if (error)
                *error = QStringLiteral("Setup payload has no devices array");
            return false;
        }
        deviceRecords = devices.toArray();
        gatewayRecords = root.toObject().value(QStringLiteral("gateways")).toArray();
    } else {
        if (error)
            *error = QStringLiteral("Setup payload is not a sequence of device records");
        return false;
    }

    Snapshot snapshot;
    snapshot.timestampMs = timestampMs;

    for (int i = 0; i < deviceRecords.size(); ++i) {
        Device device;
        QString deviceError;
        if (!parseDeviceRecord(deviceRecords.at(i), i, &device, &deviceError)) {
            qCWarning(coordinatorLog).noquote()
                << "Device record" << i << "(" << device.id << ") could not be parsed:" << deviceError;
        }

        if (snapshot.devices.contains(device.id)) {
            qCWarning(coordinatorLog).noquote()
                << "Duplicate device" << device.id << "at record" << i << "ignored";
            continue;
        }
        snapshot.devices.insert(device.id, std::move(device));
    }

    for (const QJsonValue &entry : std::as_const(gatewayRecords)) {
        if (entry.isObject())
            snapshot.gateways.append(parseGateway(entry.toObject()));
    }

    snapshot.sequence = ++m_sequence;
    *out = std::move(snapshot);
    if (error)
        error->clear();
    return true;
}

} // namespace phicore::cozytouch
