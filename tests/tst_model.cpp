#include <QJsonArray>
#include <QJsonObject>
#include <QtTest>

#include "cozytouch_model.h"

using namespace phicore::cozytouch;

class ModelTest : public QObject
{
    Q_OBJECT

private slots:
    void wholeNumbersBecomeIntegers();
    void floatTypeCodeKeepsNumbers();
    void integerAndNumberAreDistinct();
    void nestedValuesBecomeOpaque();
    void taggedValueCarriesType();
    void unitHints_data();
    void unitHints();
    void displayNames_data();
    void displayNames();
    void keyOrderingIsLexicographic();
};

void ModelTest::wholeNumbersBecomeIntegers()
{
    const StateValue value = stateValueFromJson(QJsonValue(21));
    QVERIFY(std::holds_alternative<std::int64_t>(value));
    QCOMPARE(std::get<std::int64_t>(value), std::int64_t(21));

    const StateValue fractional = stateValueFromJson(QJsonValue(21.5));
    QVERIFY(std::holds_alternative<double>(fractional));
    QCOMPARE(std::get<double>(fractional), 21.5);
}

void ModelTest::floatTypeCodeKeepsNumbers()
{
    const StateValue value = stateValueFromJson(QJsonValue(21), 2);
    QVERIFY(std::holds_alternative<double>(value));
    QCOMPARE(std::get<double>(value), 21.0);
}

void ModelTest::integerAndNumberAreDistinct()
{
    const StateValue integer = std::int64_t(21);
    const StateValue number = 21.0;
    QVERIFY(integer != number);
    QVERIFY(integer == StateValue(std::int64_t(21)));
}

void ModelTest::nestedValuesBecomeOpaque()
{
    const StateValue nullValue = stateValueFromJson(QJsonValue(QJsonValue::Null));
    QVERIFY(std::holds_alternative<OpaqueValue>(nullValue));
    QCOMPARE(std::get<OpaqueValue>(nullValue).raw, QByteArray("null"));

    const QJsonArray array{1, QStringLiteral("two")};
    const StateValue arrayValue = stateValueFromJson(array, 10);
    QVERIFY(std::holds_alternative<OpaqueValue>(arrayValue));
    QCOMPARE(std::get<OpaqueValue>(arrayValue).raw, QByteArray("[1,\"two\"]"));
}

void ModelTest::taggedValueCarriesType()
{
    const QJsonObject integer = taggedStateValue(std::int64_t(7));
    QCOMPARE(integer.value(QStringLiteral("type")).toString(), QStringLiteral("integer"));
    QCOMPARE(integer.value(QStringLiteral("value")).toInt(), 7);

    const QJsonObject opaque = taggedStateValue(OpaqueValue{QByteArrayLiteral("{\"a\":1}")});
    QCOMPARE(opaque.value(QStringLiteral("type")).toString(), QStringLiteral("opaque"));
    QVERIFY(!opaque.contains(QStringLiteral("value")));
    QCOMPARE(opaque.value(QStringLiteral("raw")).toString(), QStringLiteral("{\"a\":1}"));
}

void ModelTest::unitHints_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<QString>("unit");

    QTest::newRow("known temperature") << QStringLiteral("core:TemperatureState") << QStringLiteral("°C");
    QTest::newRow("known energy") << QStringLiteral("core:ElectricEnergyConsumptionState") << QStringLiteral("Wh");
    QTest::newRow("known duration") << QStringLiteral("io:HeatPumpOperatingTimeState") << QStringLiteral("h");
    QTest::newRow("temperature fragment") << QStringLiteral("modbuslink:DHWAbsenceTemperatureState") << QStringLiteral("°C");
    QTest::newRow("power fragment") << QStringLiteral("io:PowerHeatElectricalState") << QStringLiteral("W");
    QTest::newRow("level fragment") << QStringLiteral("core:BatteryLevelState") << QStringLiteral("%");
    QTest::newRow("no hint") << QStringLiteral("core:NameState") << QString();
}

void ModelTest::unitHints()
{
    QFETCH(QString, name);
    QFETCH(QString, unit);
    QCOMPARE(inferUnitHint(name), unit);
}

void ModelTest::displayNames_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<QString>("display");

    QTest::newRow("simple") << QStringLiteral("core:TemperatureState") << QStringLiteral("Temperature");
    QTest::newRow("acronym") << QStringLiteral("core:TargetDHWTemperatureState") << QStringLiteral("Target DHW Temperature");
    QTest::newRow("on off") << QStringLiteral("core:OnOffState") << QStringLiteral("On Off");
    QTest::newRow("no namespace") << QStringLiteral("OperatingMode") << QStringLiteral("Operating Mode");
}

void ModelTest::displayNames()
{
    QFETCH(QString, name);
    QFETCH(QString, display);
    QCOMPARE(fieldDisplayName(name), display);
}

void ModelTest::keyOrderingIsLexicographic()
{
    const DiscoveryKey a{QStringLiteral("io://1234/1#1"), QStringLiteral("core:TemperatureState")};
    const DiscoveryKey b{QStringLiteral("io://1234/1#1"), QStringLiteral("core:TargetTemperatureState")};
    const DiscoveryKey c{QStringLiteral("io://1234/1#2"), QStringLiteral("core:AState")};

    QVERIFY(b < a);
    QVERIFY(a < c);
    QVERIFY(!(a < a));
    QCOMPARE(qHash(a), qHash(DiscoveryKey{a.deviceId, a.field}));
}

QTEST_GUILESS_MAIN(ModelTest)

#include "tst_model.moc"
