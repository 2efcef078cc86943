#include <QJsonArray>
#include <QtTest>

#include "cozytouch_coordinator.h"
#include "cozytouch_events.h"
#include "cozytouch_gateway.h"
#include "fakegateway.h"

using namespace phicore::cozytouch;
using namespace phicore::cozytouch::test;

namespace {

const QString kHeater = QStringLiteral("io://1234-5678/1");
const QString kTemperature = QStringLiteral("core:TemperatureState");

class CountingObserver : public DiscoveryObserver
{
public:
    int batches = 0;

    bool applyBatch(const DiscoveryBatch &, QString *) override
    {
        ++batches;
        return true;
    }
};

} // namespace

class ExclusiveGatewayTest : public QObject
{
    Q_OBJECT

private slots:
    void sequentialCallsPassThrough();
    void eventPollDuringListIsRejected();
    void loginDuringListIsRejected();
    void missingInnerGatewayFails();
};

void ExclusiveGatewayTest::sequentialCallsPassThrough()
{
    FakeGateway gateway;
    gateway.setup = {ok(setupPayload({deviceRecord(kHeater, QStringLiteral("Heater"), {{kTemperature, 21}})}))};
    gateway.events = {ok(QByteArrayLiteral("[]"))};

    ExclusiveGateway exclusive(&gateway);
    QByteArray payload;
    QCOMPARE(exclusive.login(), ApiStatus::Ok);
    QCOMPARE(exclusive.listDevices(&payload), ApiStatus::Ok);
    QVERIFY(!payload.isEmpty());
    QCOMPARE(exclusive.fetchEvents(42, &payload), ApiStatus::Ok);
    QCOMPARE(payload, QByteArrayLiteral("[]"));

    QCOMPARE(gateway.loginCalls, 1);
    QCOMPARE(gateway.listCalls, 1);
    QCOMPARE(gateway.eventSince.size(), 1);
    QCOMPARE(gateway.eventSince.first(), std::int64_t(42));
    QCOMPARE(exclusive.rejectedCalls(), 0);
    QVERIFY(!exclusive.isBusy());
}

void ExclusiveGatewayTest::eventPollDuringListIsRejected()
{
    FakeGateway gateway;
    gateway.setup = {ok(setupPayload({deviceRecord(kHeater, QStringLiteral("Heater"), {{kTemperature, 21}})}))};
    gateway.events = {ok(eventPayload({eventRecord(QStringLiteral("DeviceStateChangedEvent"), kHeater, 1000)}))};

    ExclusiveGateway exclusive(&gateway);
    CountingObserver observer;
    DiscoveryCoordinator coordinator(&exclusive);
    coordinator.addObserver(&observer);
    EventTracker tracker(&exclusive);

    // The tracker timer firing inside the blocked setup request.
    ApiStatus nestedStatus = ApiStatus::Ok;
    QString nestedError;
    bool busyDuringList = false;
    gateway.duringList = [&]() {
        busyDuringList = exclusive.isBusy();
        nestedStatus = tracker.pollOnce(nullptr, &nestedError);
    };

    coordinator.start(false);
    coordinator.forceRefresh();

    QVERIFY(busyDuringList);
    QCOMPARE(nestedStatus, ApiStatus::TransportError);
    QCOMPARE(nestedError, QStringLiteral("Cozytouch gateway busy"));
    QCOMPARE(gateway.eventCalls, 0);
    QCOMPARE(exclusive.rejectedCalls(), 1);
    QCOMPARE(tracker.consecutiveFailures(), 1);

    QCOMPARE(observer.batches, 1);
    QCOMPARE(coordinator.status().consecutiveFailures, 0);
    QVERIFY(coordinator.currentSnapshot());
    QCOMPARE(coordinator.currentSnapshot()->devices.size(), 1);
    QVERIFY(!exclusive.isBusy());

    gateway.duringList = nullptr;
    QCOMPARE(tracker.pollOnce(), ApiStatus::Ok);
    QCOMPARE(gateway.eventCalls, 1);
    QCOMPARE(tracker.consecutiveFailures(), 0);
    QCOMPARE(tracker.size(), 1);
}

void ExclusiveGatewayTest::loginDuringListIsRejected()
{
    FakeGateway gateway;
    gateway.setup = {ok(setupPayload({}))};

    ExclusiveGateway exclusive(&gateway);
    ApiStatus nestedStatus = ApiStatus::Ok;
    gateway.duringList = [&]() { nestedStatus = exclusive.login(); };

    QByteArray payload;
    QString error;
    QCOMPARE(exclusive.listDevices(&payload, &error), ApiStatus::Ok);
    QCOMPARE(nestedStatus, ApiStatus::TransportError);
    QCOMPARE(gateway.loginCalls, 0);
    QCOMPARE(gateway.listCalls, 1);

    QCOMPARE(exclusive.login(), ApiStatus::Ok);
    QCOMPARE(gateway.loginCalls, 1);
}

void ExclusiveGatewayTest::missingInnerGatewayFails()
{
    ExclusiveGateway exclusive(nullptr);
    QByteArray payload;
    QString error;
    QCOMPARE(exclusive.fetchEvents(0, &payload, &error), ApiStatus::TransportError);
    QVERIFY(!error.isEmpty());
    QCOMPARE(exclusive.rejectedCalls(), 0);
}

QTEST_GUILESS_MAIN(ExclusiveGatewayTest)

#include "tst_exclusivegateway.moc"
