#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtTest>

#include "cozytouch_events.h"
#include "cozytouch_overkiz.h"
#include "fakegateway.h"

using namespace phicore::cozytouch;
using namespace phicore::cozytouch::test;

namespace {

HttpResult failed(int statusCode, const QByteArray &payload)
{
    HttpResult result;
    result.statusCode = statusCode;
    result.payload = payload;
    result.error = QStringLiteral("HTTP %1").arg(statusCode);
    return result;
}

} // namespace

class OverkizTest : public QObject
{
    Q_OBJECT

private slots:
    void successIsOk();
    void classification_data();
    void classification();
    void timeoutIsTransport();
    void errorMessagePreference();
    void eventsAreFilteredByTimestamp();
    void emptyEventBodyIsEmptyArray();
    void nonArrayEventBodyIsRejected();
    void latin1EventBodyIsKept();
};

void OverkizTest::successIsOk()
{
    HttpResult result;
    result.ok = true;
    result.statusCode = 200;
    QCOMPARE(classifyHttpResult(result), ApiStatus::Ok);
}

void OverkizTest::classification_data()
{
    QTest::addColumn<int>("statusCode");
    QTest::addColumn<QByteArray>("payload");
    QTest::addColumn<int>("expected");

    QTest::newRow("401") << 401 << QByteArray() << int(ApiStatus::AuthError);
    QTest::newRow("403") << 403 << QByteArray() << int(ApiStatus::AuthError);
    QTest::newRow("auth error code")
        << 400 << QByteArray("{\"errorCode\":\"AUTHENTICATION_ERROR\",\"error\":\"Bad credentials\"}")
        << int(ApiStatus::AuthError);
    QTest::newRow("oauth invalid grant")
        << 400 << QByteArray("{\"error\":\"invalid_grant\",\"error_description\":\"Provided Authorization Grant is invalid.\"}")
        << int(ApiStatus::AuthError);
    QTest::newRow("not authenticated")
        << 400 << QByteArray("{\"errorCode\":\"UNSPECIFIED_ERROR\",\"error\":\"Not authenticated\"}")
        << int(ApiStatus::AuthError);
    QTest::newRow("server error") << 500 << QByteArray("Internal Server Error") << int(ApiStatus::TransportError);
    QTest::newRow("maintenance")
        << 503 << QByteArray("{\"errorCode\":\"SERVER_MAINTENANCE\",\"error\":\"Server is down for maintenance\"}")
        << int(ApiStatus::TransportError);
    QTest::newRow("no reply") << 0 << QByteArray() << int(ApiStatus::TransportError);
}

void OverkizTest::classification()
{
    QFETCH(int, statusCode);
    QFETCH(QByteArray, payload);
    QFETCH(int, expected);
    QCOMPARE(int(classifyHttpResult(failed(statusCode, payload))), expected);
}

void OverkizTest::timeoutIsTransport()
{
    HttpResult result = failed(401, QByteArray());
    result.timedOut = true;
    QCOMPARE(classifyHttpResult(result), ApiStatus::TransportError);
}

void OverkizTest::errorMessagePreference()
{
    QCOMPARE(extractOverkizError("{\"error\":\"invalid_grant\",\"error_description\":\"Bad password\"}"),
             QStringLiteral("Bad password"));
    QCOMPARE(extractOverkizError("{\"errorCode\":\"RESOURCE_ACCESS_DENIED\",\"error\":\"Access denied\"}"),
             QStringLiteral("Access denied"));
    QCOMPARE(extractOverkizError("{\"errorCode\":\"RESOURCE_ACCESS_DENIED\"}"),
             QStringLiteral("RESOURCE_ACCESS_DENIED"));
    QVERIFY(extractOverkizError("not json").isEmpty());
    QVERIFY(extractOverkizError("[1,2]").isEmpty());
}

void OverkizTest::eventsAreFilteredByTimestamp()
{
    const QString url = QStringLiteral("io://1234-5678/1");
    QJsonObject undated = eventRecord(QStringLiteral("GatewaySynchronizationEndedEvent"), QString(), 0);
    undated.remove(QStringLiteral("timestamp"));

    const QJsonArray events{
        eventRecord(QStringLiteral("DeviceStateChangedEvent"), url, 1000),
        eventRecord(QStringLiteral("DeviceStateChangedEvent"), url, 2000),
        eventRecord(QStringLiteral("DeviceAvailableEvent"), url, 3000),
        undated,
    };

    QByteArray filtered;
    QVERIFY(filterEventsSince(eventPayload(events), 2000, &filtered));

    const QJsonArray kept = QJsonDocument::fromJson(filtered).array();
    QCOMPARE(kept.size(), 3);
    QCOMPARE(kept.at(0).toObject().value(QStringLiteral("timestamp")).toInteger(), qint64(2000));
    QCOMPARE(kept.at(1).toObject().value(QStringLiteral("timestamp")).toInteger(), qint64(3000));
    QVERIFY(!kept.at(2).toObject().contains(QStringLiteral("timestamp")));
}

void OverkizTest::emptyEventBodyIsEmptyArray()
{
    QByteArray filtered;
    QVERIFY(filterEventsSince(QByteArrayLiteral("  \n"), 0, &filtered));
    QCOMPARE(filtered, QByteArrayLiteral("[]"));
}

void OverkizTest::nonArrayEventBodyIsRejected()
{
    QByteArray filtered;
    QVERIFY(!filterEventsSince(QByteArrayLiteral("{\"error\":\"x\"}"), 0, &filtered));
    QVERIFY(!filterEventsSince(QByteArrayLiteral("[1,"), 0, &filtered));
}

void OverkizTest::latin1EventBodyIsKept()
{
    const QByteArray body("[{\"name\":\"DeviceStateChangedEvent\",\"deviceURL\":\"io://1/1\","
                          "\"label\":\"Salle d'\xE9t\xE9\",\"timestamp\":2000}]");
    QByteArray filtered;
    QVERIFY(filterEventsSince(body, 1000, &filtered));

    const QJsonArray events = QJsonDocument::fromJson(filtered).array();
    QCOMPARE(events.size(), 1);
    QVERIFY(events.first().toObject().value(QStringLiteral("label")).toString().contains(QChar(QChar::ReplacementCharacter)));

    QList<RemoteEvent> parsed;
    QVERIFY(EventTracker::parseEvents(body, &parsed));
    QCOMPARE(parsed.size(), 1);
    QCOMPARE(parsed.first().deviceId, QStringLiteral("io://1/1"));
}

QTEST_GUILESS_MAIN(OverkizTest)

#include "tst_overkiz.moc"
