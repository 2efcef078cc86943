#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>

#include "cozytouch_backoff.h"

namespace phicore::cozytouch {

struct ServerInfo {
    QString key;
    QString name;
    QString manufacturer;
    QString endpoint;
};

const QList<ServerInfo> &supportedServers();
bool findServer(const QString &key, ServerInfo *out);

inline constexpr const char kDefaultServer[] = "atlantic_cozytouch";
inline constexpr const char kDefaultAuthUrl[] = "https://apis.groupe-atlantic.com";

struct CozytouchConfig {
    QString username;
    QString password;
    QString server = QString::fromLatin1(kDefaultServer);
    // Empty means: take it from the server table / built-in defaults.
    QString endpoint;
    QString authUrl;
    QString clientId;

    int pollIntervalSec = 30;
    int eventPollIntervalSec = 10;
    int eventBufferCapacity = 50;
    int maxConsecutiveFailures = 5;
    int maxBackoffSec = 900;
    int requestTimeoutMs = 10000;
    bool refreshOnEvents = true;

    bool hasCredentials() const;

    QString effectiveEndpoint() const;
    QString effectiveAuthUrl() const;
    QString effectiveClientId() const;

    BackoffPolicy pollBackoff() const;
    BackoffPolicy eventBackoff() const;

    QJsonObject toJson() const;
    QJsonObject toRedactedJson() const;

    static CozytouchConfig fromJson(const QJsonObject &obj);
};

// Replaces credential-like values (recursively) with a marker.
QJsonObject redactSecrets(const QJsonObject &obj);

} // namespace phicore::cozytouch
