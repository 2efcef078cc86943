#include "cozytouch_config.h"

#include <algorithm>

#include <QJsonArray>
#include <QSet>
#include <QVariant>

namespace phicore::cozytouch {

namespace {

// Public OAuth client of the Cozytouch mobile application.
constexpr auto kCozytouchClientId =
    "Q3RfMUpWeVRtSUxYOEllZkE3YVVOQmpGblpVYToyRWNORHpfZHkzNDJVSnFvMlo3cFNKTnZVdjBh";

const QString kRedactedMarker = QStringLiteral("**REDACTED**");

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback = QString())
{
    const QJsonValue value = obj.value(key);
    if (!value.isString())
        return fallback;
    return value.toString().trimmed();
}

const QSet<QString> &secretKeys()
{
    static const QSet<QString> keys = {
        QStringLiteral("username"),
        QStringLiteral("password"),
        QStringLiteral("email"),
        QStringLiteral("token"),
        QStringLiteral("access_token"),
        QStringLiteral("refresh_token"),
        QStringLiteral("jwt"),
    };
    return keys;
}

QJsonValue redactValue(const QJsonValue &value)
{
    if (value.isObject())
        return redactSecrets(value.toObject());
    if (value.isArray()) {
        QJsonArray out;
        for (const QJsonValue &entry : value.toArray())
            out.append(redactValue(entry));
        return out;
    }
    return value;
}

} // namespace

const QList<ServerInfo> &supportedServers()
{
    static const QList<ServerInfo> servers = {
        {QStringLiteral("atlantic_cozytouch"),
         QStringLiteral("Atlantic Cozytouch"),
         QStringLiteral("Atlantic"),
         QStringLiteral("https://ha110-1.overkiz.com/enduser-mobile-web/enduserAPI/")},
    };
    return servers;
}

bool findServer(const QString &key, ServerInfo *out)
{
    for (const ServerInfo &server : supportedServers()) {
        if (server.key != key)
            continue;
        if (out)
            *out = server;
        return true;
    }
    return false;
}

bool CozytouchConfig::hasCredentials() const
{
    return !username.trimmed().isEmpty() && !password.isEmpty();
}

QString CozytouchConfig::effectiveEndpoint() const
{
    QString url = endpoint.trimmed();
    if (url.isEmpty()) {
        ServerInfo info;
        if (findServer(server, &info))
            url = info.endpoint;
    }
    if (!url.isEmpty() && !url.endsWith(QLatin1Char('/')))
        url.append(QLatin1Char('/'));
    return url;
}

QString CozytouchConfig::effectiveAuthUrl() const
{
    QString url = authUrl.trimmed();
    if (url.isEmpty())
        url = QString::fromLatin1(kDefaultAuthUrl);
    while (url.endsWith(QLatin1Char('/')))
        url.chop(1);
    return url;
}

QString CozytouchConfig::effectiveClientId() const
{
    const QString id = clientId.trimmed();
    return id.isEmpty() ? QString::fromLatin1(kCozytouchClientId) : id;
}

BackoffPolicy CozytouchConfig::pollBackoff() const
{
    BackoffPolicy policy;
    policy.baseMs = pollIntervalSec * 1000;
    policy.maxDelayMs = std::max(pollIntervalSec, maxBackoffSec) * 1000;
    return policy;
}

BackoffPolicy CozytouchConfig::eventBackoff() const
{
    BackoffPolicy policy;
    policy.baseMs = eventPollIntervalSec * 1000;
    policy.maxDelayMs = std::max(eventPollIntervalSec, maxBackoffSec) * 1000;
    return policy;
}

QJsonObject CozytouchConfig::toJson() const
{
    QJsonObject out;
    out.insert(QStringLiteral("username"), username);
    out.insert(QStringLiteral("password"), password);
    out.insert(QStringLiteral("server"), server);
    if (!endpoint.isEmpty())
        out.insert(QStringLiteral("endpoint"), endpoint);
    if (!authUrl.isEmpty())
        out.insert(QStringLiteral("authUrl"), authUrl);
    if (!clientId.isEmpty())
        out.insert(QStringLiteral("clientId"), clientId);
    out.insert(QStringLiteral("pollIntervalSec"), pollIntervalSec);
    out.insert(QStringLiteral("eventPollIntervalSec"), eventPollIntervalSec);
    out.insert(QStringLiteral("eventBufferCapacity"), eventBufferCapacity);
    out.insert(QStringLiteral("maxConsecutiveFailures"), maxConsecutiveFailures);
    out.insert(QStringLiteral("maxBackoffSec"), maxBackoffSec);
    out.insert(QStringLiteral("requestTimeoutMs"), requestTimeoutMs);
    out.insert(QStringLiteral("refreshOnEvents"), refreshOnEvents);
    return out;
}

QJsonObject CozytouchConfig::toRedactedJson() const
{
    QJsonObject out = redactSecrets(toJson());
    if (out.contains(QStringLiteral("clientId")))
        out.insert(QStringLiteral("clientId"), kRedactedMarker);
    return out;
}

CozytouchConfig CozytouchConfig::fromJson(const QJsonObject &obj)
{
    CozytouchConfig config;
    config.username = readString(obj, QStringLiteral("username"));
    // Passwords are taken verbatim; leading/trailing blanks can be significant.
    config.password = obj.value(QStringLiteral("password")).toString();
    config.server = readString(obj, QStringLiteral("server"), config.server);
    if (config.server.isEmpty())
        config.server = QString::fromLatin1(kDefaultServer);
    config.endpoint = readString(obj, QStringLiteral("endpoint"));
    config.authUrl = readString(obj, QStringLiteral("authUrl"));
    config.clientId = readString(obj, QStringLiteral("clientId"));

    config.pollIntervalSec = std::clamp(readInt(obj, QStringLiteral("pollIntervalSec"), 30), 5, 3600);
    config.eventPollIntervalSec = std::clamp(readInt(obj, QStringLiteral("eventPollIntervalSec"), 10), 2, 3600);
    config.eventBufferCapacity = std::clamp(readInt(obj, QStringLiteral("eventBufferCapacity"), 50), 1, 10000);
    config.maxConsecutiveFailures = std::clamp(readInt(obj, QStringLiteral("maxConsecutiveFailures"), 5), 1, 1000);
    config.maxBackoffSec = std::clamp(readInt(obj, QStringLiteral("maxBackoffSec"), 900),
                                      config.pollIntervalSec,
                                      86400);
    config.requestTimeoutMs = std::clamp(readInt(obj, QStringLiteral("requestTimeoutMs"), 10000), 1000, 120000);
    config.refreshOnEvents = obj.value(QStringLiteral("refreshOnEvents")).toBool(true);
    return config;
}

QJsonObject redactSecrets(const QJsonObject &obj)
{
    QJsonObject out;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (secretKeys().contains(it.key().toLower()))
            out.insert(it.key(), kRedactedMarker);
        else
            out.insert(it.key(), redactValue(it.value()));
    }
    return out;
}

} // namespace phicore::cozytouch
