#include "cozytouch_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>

namespace phicore::cozytouch {

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QUrl HttpClient::resolve(const QString &baseUrl, const QString &path)
{
    QString base = baseUrl.trimmed();
    if (!base.endsWith(QLatin1Char('/')))
        base.append(QLatin1Char('/'));
    QString relative = path;
    while (relative.startsWith(QLatin1Char('/')))
        relative.remove(0, 1);
    return QUrl(base + relative);
}

HttpResult HttpClient::get(const QUrl &url, const RawHeaders &headers, int timeoutMs) const
{
    return request(QByteArrayLiteral("GET"), url, {}, {}, headers, timeoutMs);
}

HttpResult HttpClient::postForm(const QUrl &url,
                                const QUrlQuery &form,
                                const RawHeaders &headers,
                                int timeoutMs) const
{
    // QUrlQuery leaves '+' unencoded, which form decoders read as a space.
    QByteArray body;
    const auto items = form.queryItems(QUrl::FullyDecoded);
    for (const auto &item : items) {
        if (!body.isEmpty())
            body.append('&');
        body.append(QUrl::toPercentEncoding(item.first));
        body.append('=');
        body.append(QUrl::toPercentEncoding(item.second));
    }

    return request(QByteArrayLiteral("POST"),
                   url,
                   body,
                   QByteArrayLiteral("application/x-www-form-urlencoded"),
                   headers,
                   timeoutMs);
}

HttpResult HttpClient::postJson(const QUrl &url,
                                const QByteArray &payload,
                                const RawHeaders &headers,
                                int timeoutMs) const
{
    return request(QByteArrayLiteral("POST"),
                   url,
                   payload,
                   QByteArrayLiteral("application/json"),
                   headers,
                   timeoutMs);
}

bool HttpClient::buildRequest(const QUrl &url,
                              const RawHeaders &headers,
                              const QByteArray &contentType,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid request URL: %1").arg(url.toString());
        return false;
    }

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "phi-adapter-cozytouch-ipc/1.0");
    if (!contentType.isEmpty())
        out.setHeader(QNetworkRequest::ContentTypeHeader, QString::fromLatin1(contentType));
    for (const auto &header : headers)
        out.setRawHeader(header.first, header.second);

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const QByteArray &method,
                               const QUrl &url,
                               const QByteArray &payload,
                               const QByteArray &contentType,
                               const RawHeaders &headers,
                               int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(url, headers, contentType, &requestObj, &result.error))
        return result;

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, payload);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : 10000);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.timedOut = true;
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        reply->deleteLater();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300) {
        result.ok = true;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }

    reply->deleteLater();
    return result;
}

} // namespace phicore::cozytouch
