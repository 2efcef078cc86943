#pragma once

#include <cstdint>

#include <QByteArray>
#include <QString>

#include "cozytouch_config.h"
#include "cozytouch_gateway.h"
#include "cozytouch_http.h"

class QNetworkAccessManager;

namespace phicore::cozytouch {

// ApiGateway for Overkiz based clouds (Atlantic Cozytouch). The session is a
// cookie kept by the network manager; an expired session is re-opened once
// per call before AuthError is reported.
class OverkizGateway final : public ApiGateway
{
public:
    OverkizGateway(QNetworkAccessManager *manager, const CozytouchConfig &config);

    void setConfig(const CozytouchConfig &config);
    const CozytouchConfig &config() const { return m_config; }

    ApiStatus login(QString *error = nullptr) override;
    ApiStatus listDevices(QByteArray *payload, QString *error = nullptr) override;
    ApiStatus fetchEvents(std::int64_t sinceMs, QByteArray *payload, QString *error = nullptr) override;

    void resetSession();
    bool hasSession() const { return m_hasSession; }

private:
    enum class CallKind {
        Get,
        PostJson
    };

    ApiStatus requestAccessToken(QString *accessToken, QString *error);
    ApiStatus requestJwt(const QString &accessToken, QString *jwt, QString *error);
    ApiStatus openSession(const QString &jwt, QString *error);

    ApiStatus sessionCall(CallKind kind, const QString &path, HttpResult *result, QString *error);
    ApiStatus registerListener(QString *error);
    ApiStatus fetchListener(HttpResult *result, QString *error);

    QNetworkAccessManager *m_manager = nullptr;
    HttpClient m_http;
    CozytouchConfig m_config;
    bool m_hasSession = false;
    QString m_listenerId;
};

ApiStatus classifyHttpResult(const HttpResult &result);
QString extractOverkizError(const QByteArray &payload);

// Keeps the events of a raw event array whose timestamp is not older than
// sinceMs. Returns false when the payload is not a JSON array.
bool filterEventsSince(const QByteArray &payload, std::int64_t sinceMs, QByteArray *out);

} // namespace phicore::cozytouch
