#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QStringList>

namespace phicore::cozytouch {

// Value whose shape is unknown. Holds the compact JSON text (or raw bytes)
// exactly as received.
struct OpaqueValue {
    QByteArray raw;

    bool operator==(const OpaqueValue &other) const { return raw == other.raw; }
    bool operator!=(const OpaqueValue &other) const { return raw != other.raw; }
};

using StateValue = std::variant<std::int64_t, double, bool, QString, OpaqueValue>;

enum class ApiStatus {
    Ok,
    TransportError,
    AuthError,
    MalformedPayload
};

const char *apiStatusName(ApiStatus status);

struct StateEntry {
    QString name;
    StateValue value;
    int dataType = 0;
    QString unitHint;
};

struct Device {
    QString id;
    QString typeLabel;
    QString label;
    QString widget;
    QString uiClass;
    QString protocol;
    bool available = true;
    bool enabled = true;
    QList<StateEntry> states;
    QMap<QString, StateValue> attributes;
    QStringList commands;
    QStringList stateDefinitions;
    QJsonObject raw;
    // Non-empty when the vendor record could not be parsed; states is then empty.
    QString parseError;

    const StateEntry *state(const QString &name) const;
};

struct Gateway {
    QString id;
    bool alive = false;
    QJsonObject raw;
};

struct Snapshot {
    std::uint64_t sequence = 0;
    std::int64_t timestampMs = 0;
    QMap<QString, Device> devices;
    QList<Gateway> gateways;

    int stateCount() const;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

struct DiscoveryKey {
    QString deviceId;
    QString field;

    QString toString() const;
};

bool operator==(const DiscoveryKey &lhs, const DiscoveryKey &rhs) noexcept;
bool operator!=(const DiscoveryKey &lhs, const DiscoveryKey &rhs) noexcept;
bool operator<(const DiscoveryKey &lhs, const DiscoveryKey &rhs) noexcept;
size_t qHash(const DiscoveryKey &key, size_t seed = 0) noexcept;

enum class Classification {
    New,
    Changed,
    Unchanged,
    Missing
};

const char *classificationName(Classification classification);

struct DiscoveryEvent {
    DiscoveryKey key;
    Classification classification = Classification::Unchanged;
    // For Missing: the last value seen before the field disappeared.
    StateValue value;
    std::optional<StateValue> previousValue;
    std::int64_t timestampMs = 0;
};

struct DiscoveryBatch {
    std::uint64_t sequence = 0;
    std::int64_t timestampMs = 0;
    QList<DiscoveryEvent> events;
    int unchangedCount = 0;
    SnapshotPtr snapshot;
};

struct RemoteEvent {
    std::uint64_t sequence = 0;
    std::int64_t timestampMs = 0;
    QString deviceId;
    QString name;
    QJsonObject payload;
};

// dataType is the Overkiz state type code (1 int, 2 float, 3 string,
// 6 boolean, 10 array, 11 object); 0 when unknown.
StateValue stateValueFromJson(const QJsonValue &value, int dataType = 0);
QJsonObject taggedStateValue(const StateValue &value);
QString stateValueToString(const StateValue &value);
const char *stateValueTypeName(const StateValue &value);

QString inferUnitHint(const QString &qualifiedName);
QString fieldDisplayName(const QString &qualifiedName);

// QJsonDocument::fromJson that tolerates invalid UTF-8 inside strings: the
// bad sequences become U+FFFD and the payload is parsed again. *repaired is
// set when that happened.
QJsonDocument parseJsonPayload(const QByteArray &payload,
                               QJsonParseError *error,
                               bool *repaired = nullptr);

} // namespace phicore::cozytouch

Q_DECLARE_METATYPE(phicore::cozytouch::DiscoveryBatch)
Q_DECLARE_METATYPE(phicore::cozytouch::RemoteEvent)
