#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtTest>

#include "cozytouch_snapshot.h"
#include "fakegateway.h"

using namespace phicore::cozytouch;
using namespace phicore::cozytouch::test;

class SnapshotBuilderTest : public QObject
{
    Q_OBJECT

private slots:
    void malformedRecordDoesNotFailTheSnapshot();
    void invalidJsonFails();
    void invalidUtf8LabelDoesNotFailTheSnapshot();
    void payloadWithoutDevicesFails();
    void duplicateDeviceKeepsFirst();
    void missingIdGetsSyntheticId();
    void bareDeviceArrayIsAccepted();
    void definitionFillsCommandsAndWidget();
    void sequenceIncrements();
};

void SnapshotBuilderTest::malformedRecordDoesNotFailTheSnapshot()
{
    QJsonArray devices;
    for (int i = 1; i <= 5; ++i) {
        devices.append(deviceRecord(QStringLiteral("io://1234-5678/%1").arg(i),
                                    QStringLiteral("Device %1").arg(i),
                                    {{QStringLiteral("core:TemperatureState"), 20 + i}}));
    }
    QJsonObject broken = deviceRecord(QStringLiteral("io://1234-5678/99"), QStringLiteral("Broken"), {});
    broken.insert(QStringLiteral("states"), QStringLiteral("not a list"));
    devices.append(broken);

    SnapshotBuilder builder;
    Snapshot snapshot;
    QString error;
    QVERIFY2(builder.build(setupPayload(devices), 1000, &snapshot, &error), qPrintable(error));

    QCOMPARE(snapshot.devices.size(), 6);
    QCOMPARE(snapshot.timestampMs, std::int64_t(1000));
    QCOMPARE(snapshot.stateCount(), 5);

    const Device &bad = snapshot.devices.value(QStringLiteral("io://1234-5678/99"));
    QVERIFY(bad.states.isEmpty());
    QVERIFY(!bad.parseError.isEmpty());
    QCOMPARE(bad.label, QStringLiteral("Broken"));

    const Device &good = snapshot.devices.value(QStringLiteral("io://1234-5678/3"));
    QVERIFY(good.parseError.isEmpty());
    const StateEntry *temperature = good.state(QStringLiteral("core:TemperatureState"));
    QVERIFY(temperature);
    QCOMPARE(std::get<std::int64_t>(temperature->value), std::int64_t(23));
    QCOMPARE(temperature->unitHint, QStringLiteral("°C"));
    QCOMPARE(good.protocol, QStringLiteral("io"));
}

void SnapshotBuilderTest::invalidJsonFails()
{
    SnapshotBuilder builder;
    Snapshot snapshot;
    QString error;
    QVERIFY(!builder.build(QByteArrayLiteral("<html>maintenance</html>"), 1, &snapshot, &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(builder.lastSequence(), std::uint64_t(0));
}

void SnapshotBuilderTest::invalidUtf8LabelDoesNotFailTheSnapshot()
{
    QJsonArray devices;
    for (int i = 1; i <= 5; ++i) {
        devices.append(deviceRecord(QStringLiteral("io://1234-5678/%1").arg(i),
                                    QStringLiteral("Device %1").arg(i),
                                    {{QStringLiteral("core:NameState"), QStringLiteral("Zone %1").arg(i)}}));
    }
    // Latin-1 bytes where UTF-8 is expected.
    QByteArray payload = setupPayload(devices);
    payload.replace(QByteArrayLiteral("\"Device 3\""), QByteArray("\"Salle d'\xE9t\xE9\""));
    payload.replace(QByteArrayLiteral("\"Zone 4\""), QByteArray("\"Cuisine \xE0 gauche\""));
    QVERIFY(payload.contains('\xE9'));

    SnapshotBuilder builder;
    Snapshot snapshot;
    QString error;
    QVERIFY2(builder.build(payload, 1000, &snapshot, &error), qPrintable(error));
    QCOMPARE(snapshot.devices.size(), 5);
    QCOMPARE(snapshot.stateCount(), 5);
    QCOMPARE(builder.lastSequence(), std::uint64_t(1));

    const Device &salle = snapshot.devices.value(QStringLiteral("io://1234-5678/3"));
    QVERIFY(salle.parseError.isEmpty());
    QVERIFY(salle.label.startsWith(QStringLiteral("Salle d'")));
    QVERIFY(salle.label.contains(QChar(QChar::ReplacementCharacter)));

    const StateEntry *name = snapshot.devices.value(QStringLiteral("io://1234-5678/4")).state(QStringLiteral("core:NameState"));
    QVERIFY(name);
    QVERIFY(std::get<QString>(name->value).contains(QChar(QChar::ReplacementCharacter)));

    QCOMPARE(snapshot.devices.value(QStringLiteral("io://1234-5678/5")).label, QStringLiteral("Device 5"));
}

void SnapshotBuilderTest::payloadWithoutDevicesFails()
{
    SnapshotBuilder builder;
    Snapshot snapshot;
    QVERIFY(!builder.build(QByteArrayLiteral("{\"gateways\":[]}"), 1, &snapshot));
    QVERIFY(!builder.build(QByteArrayLiteral("42"), 1, &snapshot));
}

void SnapshotBuilderTest::duplicateDeviceKeepsFirst()
{
    const QString url = QStringLiteral("io://1234-5678/1");
    const QJsonArray devices{
        deviceRecord(url, QStringLiteral("First"), {{QStringLiteral("core:TemperatureState"), 20}}),
        deviceRecord(url, QStringLiteral("Second"), {{QStringLiteral("core:TemperatureState"), 30}}),
    };

    SnapshotBuilder builder;
    Snapshot snapshot;
    QVERIFY(builder.build(setupPayload(devices), 1, &snapshot));
    QCOMPARE(snapshot.devices.size(), 1);
    QCOMPARE(snapshot.devices.value(url).label, QStringLiteral("First"));
}

void SnapshotBuilderTest::missingIdGetsSyntheticId()
{
    QJsonObject anonymous = deviceRecord(QString(), QStringLiteral("Anonymous"), {});
    anonymous.remove(QStringLiteral("deviceURL"));
    const QJsonArray devices{
        deviceRecord(QStringLiteral("io://1234-5678/1"), QStringLiteral("Known"), {}),
        anonymous,
        QJsonValue(7),
    };

    SnapshotBuilder builder;
    Snapshot snapshot;
    QVERIFY(builder.build(setupPayload(devices), 1, &snapshot));
    QCOMPARE(snapshot.devices.size(), 3);
    QVERIFY(snapshot.devices.contains(QStringLiteral("unidentified#1")));
    QVERIFY(snapshot.devices.value(QStringLiteral("unidentified#1")).parseError.isEmpty());
    QVERIFY(snapshot.devices.contains(QStringLiteral("unidentified#2")));
    QVERIFY(!snapshot.devices.value(QStringLiteral("unidentified#2")).parseError.isEmpty());
}

void SnapshotBuilderTest::bareDeviceArrayIsAccepted()
{
    const QJsonArray devices{
        deviceRecord(QStringLiteral("io://1234-5678/1"), QStringLiteral("Heater"),
                     {{QStringLiteral("core:OnOffState"), QStringLiteral("on")}}),
    };

    SnapshotBuilder builder;
    Snapshot snapshot;
    QVERIFY(builder.build(QJsonDocument(devices).toJson(QJsonDocument::Compact), 1, &snapshot));
    QCOMPARE(snapshot.devices.size(), 1);
    QVERIFY(snapshot.gateways.isEmpty());
}

void SnapshotBuilderTest::definitionFillsCommandsAndWidget()
{
    QJsonObject record = deviceRecord(QStringLiteral("io://1234-5678/1"), QStringLiteral("Heater"), {});
    record.remove(QStringLiteral("widget"));

    QJsonObject refresh;
    refresh.insert(QStringLiteral("commandName"), QStringLiteral("refreshTemperature"));
    QJsonObject setMode;
    setMode.insert(QStringLiteral("commandName"), QStringLiteral("setOperatingMode"));
    QJsonObject definition;
    definition.insert(QStringLiteral("widgetName"), QStringLiteral("AtlanticElectricalHeater"));
    definition.insert(QStringLiteral("commands"), QJsonArray{setMode, refresh, setMode});
    record.insert(QStringLiteral("definition"), definition);

    QJsonObject gateway;
    gateway.insert(QStringLiteral("gatewayId"), QStringLiteral("1234-5678"));
    gateway.insert(QStringLiteral("alive"), true);
    QJsonObject root;
    root.insert(QStringLiteral("devices"), QJsonArray{record});
    root.insert(QStringLiteral("gateways"), QJsonArray{gateway});

    SnapshotBuilder builder;
    Snapshot snapshot;
    QVERIFY(builder.build(QJsonDocument(root).toJson(QJsonDocument::Compact), 1, &snapshot));

    const Device &device = snapshot.devices.first();
    QCOMPARE(device.widget, QStringLiteral("AtlanticElectricalHeater"));
    QCOMPARE(device.commands,
             QStringList({QStringLiteral("refreshTemperature"), QStringLiteral("setOperatingMode")}));
    QCOMPARE(snapshot.gateways.size(), 1);
    QCOMPARE(snapshot.gateways.first().id, QStringLiteral("1234-5678"));
    QVERIFY(snapshot.gateways.first().alive);
}

void SnapshotBuilderTest::sequenceIncrements()
{
    SnapshotBuilder builder;
    Snapshot first;
    Snapshot second;
    QVERIFY(builder.build(setupPayload({}), 1, &first));
    QVERIFY(!builder.build(QByteArrayLiteral("{"), 2, &second));
    QVERIFY(builder.build(setupPayload({}), 3, &second));
    QCOMPARE(first.sequence, std::uint64_t(1));
    QCOMPARE(second.sequence, std::uint64_t(2));
}

QTEST_GUILESS_MAIN(SnapshotBuilderTest)

#include "tst_snapshotbuilder.moc"
