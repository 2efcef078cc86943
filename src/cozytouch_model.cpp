#include "cozytouch_model.h"

#include <cmath>

#include <QHashFunctions>
#include <QJsonArray>
#include <QJsonDocument>

namespace phicore::cozytouch {

namespace {

constexpr int kOverkizTypeInt = 1;
constexpr int kOverkizTypeFloat = 2;
constexpr double kMaxExactInteger = 9007199254740992.0;

struct UnitRule {
    const char *fragment;
    const char *unit;
};

// Checked in order; first match wins.
constexpr UnitRule kUnitRules[] = {
    {"OperatingTime", "h"},
    {"Temperature", "°C"},
    {"EnergyConsumption", "Wh"},
    {"Energy", "Wh"},
    {"PowerConsumption", "W"},
    {"Power", "W"},
    {"Humidity", "%"},
    {"Percent", "%"},
    {"Level", "%"},
};

QString unitForKnownName(const QString &qualifiedName)
{
    static const QHash<QString, QString> known = {
        {QStringLiteral("core:TemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("core:TargetTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("core:ComfortTargetDHWTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("core:EcoTargetDHWTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("core:TargetDHWTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("core:OutdoorTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("io:MiddleWaterTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("io:OutletWaterTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("io:InletWaterTemperatureState"), QStringLiteral("°C")},
        {QStringLiteral("core:ElectricPowerConsumptionState"), QStringLiteral("W")},
        {QStringLiteral("core:ElectricEnergyConsumptionState"), QStringLiteral("Wh")},
        {QStringLiteral("io:ElectricBoosterOperatingTimeState"), QStringLiteral("h")},
        {QStringLiteral("io:HeatPumpOperatingTimeState"), QStringLiteral("h")},
        {QStringLiteral("core:RelativeHumidityState"), QStringLiteral("%")},
    };
    return known.value(qualifiedName);
}

QString localName(const QString &qualifiedName)
{
    const int colon = qualifiedName.lastIndexOf(QLatin1Char(':'));
    return colon >= 0 ? qualifiedName.mid(colon + 1) : qualifiedName;
}

} // namespace

const char *apiStatusName(ApiStatus status)
{
    switch (status) {
    case ApiStatus::Ok:
        return "Ok";
    case ApiStatus::TransportError:
        return "TransportError";
    case ApiStatus::AuthError:
        return "AuthError";
    case ApiStatus::MalformedPayload:
        return "MalformedPayload";
    }
    return "Unknown";
}

const StateEntry *Device::state(const QString &name) const
{
    for (const StateEntry &entry : states) {
        if (entry.name == name)
            return &entry;
    }
    return nullptr;
}

int Snapshot::stateCount() const
{
    int count = 0;
    for (const Device &device : devices)
        count += device.states.size();
    return count;
}

QString DiscoveryKey::toString() const
{
    return deviceId + QLatin1Char('|') + field;
}

bool operator==(const DiscoveryKey &lhs, const DiscoveryKey &rhs) noexcept
{
    return lhs.deviceId == rhs.deviceId && lhs.field == rhs.field;
}

bool operator!=(const DiscoveryKey &lhs, const DiscoveryKey &rhs) noexcept
{
    return !(lhs == rhs);
}

bool operator<(const DiscoveryKey &lhs, const DiscoveryKey &rhs) noexcept
{
    const int byDevice = QString::compare(lhs.deviceId, rhs.deviceId, Qt::CaseSensitive);
    if (byDevice != 0)
        return byDevice < 0;
    return QString::compare(lhs.field, rhs.field, Qt::CaseSensitive) < 0;
}

size_t qHash(const DiscoveryKey &key, size_t seed) noexcept
{
    return qHashMulti(seed, key.deviceId, key.field);
}

const char *classificationName(Classification classification)
{
    switch (classification) {
    case Classification::New:
        return "New";
    case Classification::Changed:
        return "Changed";
    case Classification::Unchanged:
        return "Unchanged";
    case Classification::Missing:
        return "Missing";
    }
    return "Unknown";
}

StateValue stateValueFromJson(const QJsonValue &value, int dataType)
{
    if (value.isBool())
        return value.toBool();

    if (value.isString())
        return value.toString();

    if (value.isDouble()) {
        const double number = value.toDouble();
        if (dataType == kOverkizTypeFloat)
            return number;
        const bool whole = std::isfinite(number)
            && std::floor(number) == number
            && std::abs(number) < kMaxExactInteger;
        if (whole && (dataType == kOverkizTypeInt || dataType == 0))
            return static_cast<std::int64_t>(value.toInteger(static_cast<qint64>(number)));
        return number;
    }

    OpaqueValue opaque;
    if (value.isArray())
        opaque.raw = QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact);
    else if (value.isObject())
        opaque.raw = QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact);
    else
        opaque.raw = QByteArrayLiteral("null");
    return opaque;
}

QJsonObject taggedStateValue(const StateValue &value)
{
    QJsonObject out;
    out.insert(QStringLiteral("type"), QString::fromLatin1(stateValueTypeName(value)));

    if (const auto *i = std::get_if<std::int64_t>(&value))
        out.insert(QStringLiteral("value"), static_cast<qint64>(*i));
    else if (const auto *d = std::get_if<double>(&value))
        out.insert(QStringLiteral("value"), *d);
    else if (const auto *b = std::get_if<bool>(&value))
        out.insert(QStringLiteral("value"), *b);
    else if (const auto *s = std::get_if<QString>(&value))
        out.insert(QStringLiteral("value"), *s);
    else if (const auto *o = std::get_if<OpaqueValue>(&value))
        out.insert(QStringLiteral("raw"), QString::fromUtf8(o->raw));

    return out;
}

QString stateValueToString(const StateValue &value)
{
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return QString::number(static_cast<qint64>(*i));
    if (const auto *d = std::get_if<double>(&value))
        return QString::number(*d, 'g', 15);
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? QStringLiteral("true") : QStringLiteral("false");
    if (const auto *s = std::get_if<QString>(&value))
        return *s;
    if (const auto *o = std::get_if<OpaqueValue>(&value))
        return QString::fromUtf8(o->raw);
    return {};
}

const char *stateValueTypeName(const StateValue &value)
{
    if (std::holds_alternative<std::int64_t>(value))
        return "integer";
    if (std::holds_alternative<double>(value))
        return "number";
    if (std::holds_alternative<bool>(value))
        return "boolean";
    if (std::holds_alternative<QString>(value))
        return "string";
    return "opaque";
}

QString inferUnitHint(const QString &qualifiedName)
{
    const QString known = unitForKnownName(qualifiedName);
    if (!known.isEmpty())
        return known;

    const QString name = localName(qualifiedName);
    for (const UnitRule &rule : kUnitRules) {
        if (name.contains(QLatin1String(rule.fragment)))
            return QString::fromUtf8(rule.unit);
    }
    return {};
}

QString fieldDisplayName(const QString &qualifiedName)
{
    const QString name = localName(qualifiedName);

    QString words;
    words.reserve(name.size() + 8);
    for (int i = 0; i < name.size(); ++i) {
        const QChar c = name.at(i);
        if (c.isUpper() && !words.isEmpty() && !words.endsWith(QLatin1Char(' '))) {
            const QChar prev = name.at(i - 1);
            const bool nextIsLower = (i + 1 < name.size()) && name.at(i + 1).isLower();
            if (prev.isLower() || prev.isDigit() || (prev.isUpper() && nextIsLower))
                words.append(QLatin1Char(' '));
        }
        words.append(c);
    }

    if (words.endsWith(QLatin1String(" State")))
        words.chop(6);
    else if (words.endsWith(QLatin1String("State")) && words.size() > 5)
        words.chop(5);

    words = words.trimmed();
    return words.isEmpty() ? name : words;
}

QJsonDocument parseJsonPayload(const QByteArray &payload, QJsonParseError *error, bool *repaired)
{
    if (repaired)
        *repaired = false;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error == QJsonParseError::IllegalUTF8String) {
        doc = QJsonDocument::fromJson(QString::fromUtf8(payload).toUtf8(), &parseError);
        if (repaired)
            *repaired = parseError.error == QJsonParseError::NoError;
    }
    if (error)
        *error = parseError;
    return doc;
}

} // namespace phicore::cozytouch
