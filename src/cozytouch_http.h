#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkRequest;
class QUrlQuery;

namespace phicore::cozytouch {

using RawHeaders = QList<QPair<QByteArray, QByteArray>>;

struct HttpResult {
    bool ok = false;
    bool timedOut = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const QUrl &url,
                   const RawHeaders &headers = {},
                   int timeoutMs = 10000) const;

    HttpResult postForm(const QUrl &url,
                        const QUrlQuery &form,
                        const RawHeaders &headers = {},
                        int timeoutMs = 10000) const;

    HttpResult postJson(const QUrl &url,
                        const QByteArray &payload,
                        const RawHeaders &headers = {},
                        int timeoutMs = 10000) const;

    static QUrl resolve(const QString &baseUrl, const QString &path);

private:
    bool buildRequest(const QUrl &url,
                      const RawHeaders &headers,
                      const QByteArray &contentType,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const QByteArray &method,
                       const QUrl &url,
                       const QByteArray &payload,
                       const QByteArray &contentType,
                       const RawHeaders &headers,
                       int timeoutMs) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::cozytouch
