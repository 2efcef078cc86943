#include "cozytouch_overkiz.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkCookieJar>
#include <QUrlQuery>

#include "cozytouch_log.h"

namespace phicore::cozytouch {

namespace {

const QString kUsernamePrefix = QStringLiteral("GA-PRIVATEPERSON/");

bool isAuthErrorCode(const QString &code)
{
    return code == QLatin1String("AUTHENTICATION_ERROR")
        || code == QLatin1String("RESOURCE_ACCESS_DENIED")
        || code == QLatin1String("invalid_grant")
        || code == QLatin1String("invalid_client")
        || code == QLatin1String("unauthorized_client");
}

bool isAuthErrorText(const QString &text)
{
    return text.contains(QLatin1String("Bad credentials"), Qt::CaseInsensitive)
        || text.contains(QLatin1String("Not authenticated"), Qt::CaseInsensitive)
        || text.contains(QLatin1String("Missing authentication"), Qt::CaseInsensitive);
}

bool isListenerExpired(const HttpResult &result)
{
    if (result.ok || result.statusCode != 400)
        return false;
    const QString message = extractOverkizError(result.payload);
    return message.contains(QLatin1String("No registered event listener"), Qt::CaseInsensitive);
}

QString describeFailure(const HttpResult &result, const QString &fallback)
{
    const QString remote = extractOverkizError(result.payload);
    if (!remote.isEmpty())
        return remote;
    if (!result.error.isEmpty())
        return result.error;
    return fallback;
}

} // namespace

QString extractOverkizError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject())
        return {};

    const QJsonObject obj = doc.object();
    // Overkiz: {"errorCode": "...", "error": "..."}; OAuth: {"error": "...", "error_description": "..."}
    const QString description = obj.value(QStringLiteral("error_description")).toString();
    if (!description.isEmpty())
        return description;
    const QString error = obj.value(QStringLiteral("error")).toString();
    if (!error.isEmpty())
        return error;
    return obj.value(QStringLiteral("errorCode")).toString();
}

ApiStatus classifyHttpResult(const HttpResult &result)
{
    if (result.ok)
        return ApiStatus::Ok;
    if (result.timedOut)
        return ApiStatus::TransportError;
    if (result.statusCode == 401 || result.statusCode == 403)
        return ApiStatus::AuthError;

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (doc.isObject()) {
        const QJsonObject obj = doc.object();
        if (isAuthErrorCode(obj.value(QStringLiteral("errorCode")).toString())
            || isAuthErrorCode(obj.value(QStringLiteral("error")).toString())
            || isAuthErrorText(obj.value(QStringLiteral("error")).toString())) {
            return ApiStatus::AuthError;
        }
    }
    return ApiStatus::TransportError;
}

bool filterEventsSince(const QByteArray &payload, std::int64_t sinceMs, QByteArray *out)
{
    const QByteArray trimmed = payload.trimmed();
    if (trimmed.isEmpty()) {
        if (out)
            *out = QByteArrayLiteral("[]");
        return true;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = parseJsonPayload(trimmed, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray())
        return false;

    QJsonArray kept;
    const QJsonArray events = doc.array();
    for (const QJsonValue &value : events) {
        // Records without a usable timestamp are kept; the tracker stamps them.
        const QJsonValue ts = value.toObject().value(QStringLiteral("timestamp"));
        if (ts.isDouble() && static_cast<std::int64_t>(ts.toDouble()) < sinceMs)
            continue;
        kept.append(value);
    }

    if (out)
        *out = QJsonDocument(kept).toJson(QJsonDocument::Compact);
    return true;
}

OverkizGateway::OverkizGateway(QNetworkAccessManager *manager, const CozytouchConfig &config)
    : m_manager(manager)
    , m_http(manager)
    , m_config(config)
{
}

void OverkizGateway::setConfig(const CozytouchConfig &config)
{
    const bool accountChanged = config.username != m_config.username
        || config.password != m_config.password
        || config.effectiveEndpoint() != m_config.effectiveEndpoint();
    m_config = config;
    if (accountChanged)
        resetSession();
}

void OverkizGateway::resetSession()
{
    m_hasSession = false;
    m_listenerId.clear();
    // Drops the session cookie; the manager owns and deletes the old jar.
    if (m_manager)
        m_manager->setCookieJar(new QNetworkCookieJar(m_manager));
}

ApiStatus OverkizGateway::login(QString *error)
{
    resetSession();

    if (!m_config.hasCredentials()) {
        if (error)
            *error = QStringLiteral("Cozytouch username and password are required");
        return ApiStatus::AuthError;
    }
    if (m_config.effectiveEndpoint().isEmpty()) {
        if (error)
            *error = QStringLiteral("Unknown Cozytouch server: %1").arg(m_config.server);
        return ApiStatus::AuthError;
    }

    QString accessToken;
    ApiStatus status = requestAccessToken(&accessToken, error);
    if (status != ApiStatus::Ok)
        return status;

    QString jwt;
    status = requestJwt(accessToken, &jwt, error);
    if (status != ApiStatus::Ok)
        return status;

    status = openSession(jwt, error);
    if (status != ApiStatus::Ok)
        return status;

    m_hasSession = true;
    qCInfo(gatewayLog).noquote() << "Logged in to" << m_config.effectiveEndpoint();
    if (error)
        error->clear();
    return ApiStatus::Ok;
}

ApiStatus OverkizGateway::requestAccessToken(QString *accessToken, QString *error)
{
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("grant_type"), QStringLiteral("password"));
    form.addQueryItem(QStringLiteral("username"), kUsernamePrefix + m_config.username);
    form.addQueryItem(QStringLiteral("password"), m_config.password);

    const RawHeaders headers = {
        {QByteArrayLiteral("Authorization"), QByteArrayLiteral("Basic ") + m_config.effectiveClientId().toLatin1()},
    };

    const HttpResult result = m_http.postForm(HttpClient::resolve(m_config.effectiveAuthUrl(), QStringLiteral("token")),
                                              form,
                                              headers,
                                              m_config.requestTimeoutMs);
    if (!result.ok) {
        ApiStatus status = classifyHttpResult(result);
        // The token endpoint answers bad credentials with 400 invalid_grant.
        if (status == ApiStatus::TransportError && result.statusCode == 400)
            status = ApiStatus::AuthError;
        if (error)
            *error = describeFailure(result, QStringLiteral("Cozytouch token request failed"));
        qCWarning(gatewayLog).noquote() << "Token request failed:" << describeFailure(result, result.error);
        return status;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    const QString token = doc.object().value(QStringLiteral("access_token")).toString();
    if (token.isEmpty()) {
        if (error)
            *error = QStringLiteral("Token response carries no access_token");
        return ApiStatus::MalformedPayload;
    }

    if (accessToken)
        *accessToken = token;
    return ApiStatus::Ok;
}

ApiStatus OverkizGateway::requestJwt(const QString &accessToken, QString *jwt, QString *error)
{
    const RawHeaders headers = {
        {QByteArrayLiteral("Authorization"), QByteArrayLiteral("Bearer ") + accessToken.toUtf8()},
    };

    const HttpResult result = m_http.get(HttpClient::resolve(m_config.effectiveAuthUrl(),
                                                             QStringLiteral("magellan/accounts/jwt")),
                                         headers,
                                         m_config.requestTimeoutMs);
    if (!result.ok) {
        if (error)
            *error = describeFailure(result, QStringLiteral("Cozytouch JWT request failed"));
        return classifyHttpResult(result);
    }

    // The body is a bare JSON string, sometimes sent without quotes.
    QByteArray body = result.payload.trimmed();
    if (body.size() >= 2 && body.startsWith('"') && body.endsWith('"'))
        body = body.mid(1, body.size() - 2);
    if (body.isEmpty()) {
        if (error)
            *error = QStringLiteral("JWT response is empty");
        return ApiStatus::MalformedPayload;
    }

    if (jwt)
        *jwt = QString::fromUtf8(body);
    return ApiStatus::Ok;
}

ApiStatus OverkizGateway::openSession(const QString &jwt, QString *error)
{
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("jwt"), jwt);

    const HttpResult result = m_http.postForm(HttpClient::resolve(m_config.effectiveEndpoint(), QStringLiteral("login")),
                                              form,
                                              {},
                                              m_config.requestTimeoutMs);
    if (!result.ok) {
        if (error)
            *error = describeFailure(result, QStringLiteral("Overkiz login failed"));
        return classifyHttpResult(result);
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (doc.isObject() && doc.object().contains(QStringLiteral("success"))
        && !doc.object().value(QStringLiteral("success")).toBool()) {
        if (error)
            *error = QStringLiteral("Overkiz login was rejected");
        return ApiStatus::AuthError;
    }
    return ApiStatus::Ok;
}

ApiStatus OverkizGateway::sessionCall(CallKind kind, const QString &path, HttpResult *result, QString *error)
{
    if (!m_hasSession) {
        const ApiStatus status = login(error);
        if (status != ApiStatus::Ok)
            return status;
    }

    const QUrl url = HttpClient::resolve(m_config.effectiveEndpoint(), path);
    auto perform = [&]() {
        return kind == CallKind::Get
            ? m_http.get(url, {}, m_config.requestTimeoutMs)
            : m_http.postJson(url, QByteArray(), {}, m_config.requestTimeoutMs);
    };

    HttpResult out = perform();
    ApiStatus status = classifyHttpResult(out);
    if (status == ApiStatus::AuthError) {
        qCInfo(gatewayLog).noquote() << "Session rejected on" << path << "- logging in again";
        status = login(error);
        if (status != ApiStatus::Ok)
            return status;
        out = perform();
        status = classifyHttpResult(out);
        if (status == ApiStatus::AuthError)
            m_hasSession = false;
    }

    if (status != ApiStatus::Ok && error)
        *error = describeFailure(out, QStringLiteral("Request %1 failed").arg(path));
    if (result)
        *result = out;
    return status;
}

ApiStatus OverkizGateway::listDevices(QByteArray *payload, QString *error)
{
    HttpResult result;
    const ApiStatus status = sessionCall(CallKind::Get, QStringLiteral("setup"), &result, error);
    if (status != ApiStatus::Ok) {
        qCWarning(gatewayLog).noquote() << "Setup request failed:" << apiStatusName(status)
                                        << (error ? *error : result.error);
        return status;
    }

    if (payload)
        *payload = result.payload;
    if (error)
        error->clear();
    return ApiStatus::Ok;
}

ApiStatus OverkizGateway::registerListener(QString *error)
{
    HttpResult result;
    const ApiStatus status = sessionCall(CallKind::PostJson, QStringLiteral("events/register"), &result, error);
    if (status != ApiStatus::Ok)
        return status;

    const QString id = QJsonDocument::fromJson(result.payload).object().value(QStringLiteral("id")).toString();
    if (id.isEmpty()) {
        if (error)
            *error = QStringLiteral("Event listener registration returned no id");
        return ApiStatus::MalformedPayload;
    }

    m_listenerId = id;
    qCDebug(gatewayLog).noquote() << "Registered event listener" << id;
    return ApiStatus::Ok;
}

ApiStatus OverkizGateway::fetchListener(HttpResult *result, QString *error)
{
    if (m_listenerId.isEmpty()) {
        const ApiStatus status = registerListener(error);
        if (status != ApiStatus::Ok)
            return status;
    }
    return sessionCall(CallKind::PostJson,
                       QStringLiteral("events/%1/fetch").arg(m_listenerId),
                       result,
                       error);
}

ApiStatus OverkizGateway::fetchEvents(std::int64_t sinceMs, QByteArray *payload, QString *error)
{
    HttpResult result;
    ApiStatus status = fetchListener(&result, error);
    if (status != ApiStatus::Ok && isListenerExpired(result)) {
        qCInfo(gatewayLog) << "Event listener expired, registering a new one";
        m_listenerId.clear();
        status = fetchListener(&result, error);
    }
    if (status != ApiStatus::Ok) {
        // A relogin invalidates the listener as well.
        if (status == ApiStatus::AuthError || !m_hasSession)
            m_listenerId.clear();
        return status;
    }

    QByteArray filtered;
    if (!filterEventsSince(result.payload, sinceMs, &filtered)) {
        if (error)
            *error = QStringLiteral("Event payload is not a JSON array");
        return ApiStatus::MalformedPayload;
    }

    if (payload)
        *payload = filtered;
    if (error)
        error->clear();
    return ApiStatus::Ok;
}

} // namespace phicore::cozytouch
