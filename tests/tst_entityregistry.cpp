#include <memory>

#include <QSignalSpy>
#include <QtTest>

#include "cozytouch_registry.h"
#include "fakegateway.h"

using namespace phicore::cozytouch;
using namespace phicore::cozytouch::test;

namespace {

const QString kHeater = QStringLiteral("io://1234-5678/1");
const QString kTemperature = QStringLiteral("core:TemperatureState");
const QString kOnOff = QStringLiteral("core:OnOffState");

DiscoveryEvent makeEvent(const QString &field,
                         Classification classification,
                         const StateValue &value,
                         std::int64_t timestampMs)
{
    DiscoveryEvent event;
    event.key = DiscoveryKey{kHeater, field};
    event.classification = classification;
    event.value = value;
    event.timestampMs = timestampMs;
    return event;
}

DiscoveryBatch makeBatch(std::uint64_t sequence, std::int64_t timestampMs, QList<DiscoveryEvent> events)
{
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->sequence = sequence;
    snapshot->timestampMs = timestampMs;
    Device device;
    device.id = kHeater;
    device.label = QStringLiteral("Bathroom heater");
    snapshot->devices.insert(device.id, device);

    DiscoveryBatch batch;
    batch.sequence = sequence;
    batch.timestampMs = timestampMs;
    batch.events = std::move(events);
    batch.snapshot = snapshot;
    return batch;
}

} // namespace

class EntityRegistryTest : public QObject
{
    Q_OBJECT

private slots:
    void sensorDescriptor();
    void binaryDescriptor();
    void unknownTextualSwitchIsBinary();
    void onValues();
    void createsEntriesOnce();
    void replayingABatchIsIdempotent();
    void missingKeepsTheEntry();
    void staleBatchesAreIgnored();
    void unchangedKeysRefreshLastSeen();
    void lookupHelpers();
};

void EntityRegistryTest::sensorDescriptor()
{
    const EntityDescriptor descriptor = describeEntity(kHeater, QStringLiteral("Heater"), kTemperature,
                                                       StateValue(19.5));
    QCOMPARE(descriptor.kind, EntityKind::Sensor);
    QCOMPARE(descriptor.uniqueId, QStringLiteral("io___1234-5678_1_core_TemperatureState"));
    QCOMPARE(descriptor.name, QStringLiteral("Heater Temperature"));
    QCOMPARE(descriptor.deviceClass, QStringLiteral("temperature"));
    QCOMPARE(descriptor.unit, QStringLiteral("°C"));
    QCOMPARE(descriptor.stateClass, QStringLiteral("measurement"));

    const EntityDescriptor fallback = describeEntity(kHeater, QString(), QStringLiteral("io:PowerHeatPumpState"),
                                                     StateValue(std::int64_t(1200)));
    QCOMPARE(fallback.kind, EntityKind::Sensor);
    QCOMPARE(fallback.unit, QStringLiteral("W"));
    QVERIFY(fallback.name.startsWith(kHeater));
}

void EntityRegistryTest::binaryDescriptor()
{
    const EntityDescriptor descriptor = describeEntity(kHeater, QStringLiteral("Heater"), kOnOff,
                                                       StateValue(QStringLiteral("off")));
    QCOMPARE(descriptor.kind, EntityKind::BinarySensor);
    QCOMPARE(descriptor.uniqueId, QStringLiteral("io___1234-5678_1_core_OnOffState_binary"));
    QCOMPARE(descriptor.deviceClass, QStringLiteral("power"));
    QCOMPARE(QString::fromLatin1(entityKindName(descriptor.kind)), QStringLiteral("binary_sensor"));
}

void EntityRegistryTest::unknownTextualSwitchIsBinary()
{
    const EntityDescriptor text = describeEntity(kHeater, QString(), QStringLiteral("io:AwayModeState"),
                                                 StateValue(QStringLiteral("On")));
    QCOMPARE(text.kind, EntityKind::BinarySensor);
    QVERIFY(text.deviceClass.isEmpty());

    const EntityDescriptor flag = describeEntity(kHeater, QString(), QStringLiteral("io:ConnectedState"),
                                                 StateValue(true));
    QCOMPARE(flag.kind, EntityKind::BinarySensor);

    const EntityDescriptor mode = describeEntity(kHeater, QString(), QStringLiteral("io:DHWModeState"),
                                                 StateValue(QStringLiteral("manualEcoInactive")));
    QCOMPARE(mode.kind, EntityKind::Sensor);
}

void EntityRegistryTest::onValues()
{
    const EntityDescriptor status = describeEntity(kHeater, QString(), QStringLiteral("core:StatusState"),
                                                   StateValue(QStringLiteral("available")));
    QVERIFY(isOnValue(status, StateValue(QStringLiteral("Available"))));
    QVERIFY(!isOnValue(status, StateValue(QStringLiteral("unavailable"))));

    const EntityDescriptor onOff = describeEntity(kHeater, QString(), kOnOff, StateValue(true));
    QVERIFY(isOnValue(onOff, StateValue(true)));
    QVERIFY(!isOnValue(onOff, StateValue(false)));
    QVERIFY(isOnValue(onOff, StateValue(std::int64_t(1))));
}

void EntityRegistryTest::createsEntriesOnce()
{
    EntityRegistry registry;
    QSignalSpy createdSpy(&registry, &EntityRegistry::entityCreated);
    QSignalSpy updatedSpy(&registry, &EntityRegistry::entityUpdated);

    QVERIFY(registry.applyBatch(makeBatch(1, 1000, {
        makeEvent(kOnOff, Classification::New, QStringLiteral("on"), 1000),
        makeEvent(kTemperature, Classification::New, std::int64_t(21), 1000),
    })));
    QCOMPARE(registry.size(), 2);
    QCOMPARE(createdSpy.count(), 2);

    QVERIFY(registry.applyBatch(makeBatch(2, 2000, {
        makeEvent(kTemperature, Classification::Changed, std::int64_t(22), 2000),
    })));
    QCOMPARE(registry.size(), 2);
    QCOMPARE(createdSpy.count(), 2);
    QCOMPARE(updatedSpy.count(), 1);

    const std::optional<RegistryEntry> entry = registry.entry({kHeater, kTemperature});
    QVERIFY(entry.has_value());
    QCOMPARE(std::get<std::int64_t>(entry->lastValue), std::int64_t(22));
    QCOMPARE(entry->firstSeenMs, std::int64_t(1000));
    QCOMPARE(entry->lastChangedMs, std::int64_t(2000));
    QCOMPARE(entry->descriptor.name, QStringLiteral("Bathroom heater Temperature"));
    QCOMPARE(updatedSpy.at(0).at(0).toInt(), entry->handle);
}

void EntityRegistryTest::replayingABatchIsIdempotent()
{
    EntityRegistry registry;
    const DiscoveryBatch first = makeBatch(1, 1000, {
        makeEvent(kTemperature, Classification::New, std::int64_t(21), 1000),
    });
    const DiscoveryBatch second = makeBatch(2, 2000, {
        makeEvent(kTemperature, Classification::Changed, std::int64_t(22), 2000),
    });
    QVERIFY(registry.applyBatch(first));
    QVERIFY(registry.applyBatch(second));
    const RegistryEntry before = *registry.entry({kHeater, kTemperature});

    QSignalSpy createdSpy(&registry, &EntityRegistry::entityCreated);
    QSignalSpy updatedSpy(&registry, &EntityRegistry::entityUpdated);
    QSignalSpy availabilitySpy(&registry, &EntityRegistry::availabilityChanged);
    QVERIFY(registry.applyBatch(second));

    const RegistryEntry after = *registry.entry({kHeater, kTemperature});
    QCOMPARE(registry.size(), 1);
    QVERIFY(after.lastValue == before.lastValue);
    QCOMPARE(after.lastSeenMs, before.lastSeenMs);
    QCOMPARE(after.lastChangedMs, before.lastChangedMs);
    QCOMPARE(after.available, before.available);
    QCOMPARE(createdSpy.count(), 0);
    QCOMPARE(updatedSpy.count(), 0);
    QCOMPARE(availabilitySpy.count(), 0);
}

void EntityRegistryTest::missingKeepsTheEntry()
{
    EntityRegistry registry;
    QSignalSpy availabilitySpy(&registry, &EntityRegistry::availabilityChanged);

    QVERIFY(registry.applyBatch(makeBatch(1, 1000, {
        makeEvent(kTemperature, Classification::New, std::int64_t(21), 1000),
    })));
    QVERIFY(registry.applyBatch(makeBatch(2, 2000, {
        makeEvent(kTemperature, Classification::Missing, std::int64_t(21), 2000),
    })));

    QCOMPARE(registry.size(), 1);
    QCOMPARE(registry.availableCount(), 0);
    std::optional<RegistryEntry> entry = registry.entry({kHeater, kTemperature});
    QVERIFY(entry.has_value());
    QVERIFY(!entry->available);
    QCOMPARE(std::get<std::int64_t>(entry->lastValue), std::int64_t(21));
    QCOMPARE(entry->lastSeenMs, std::int64_t(1000));

    QVERIFY(registry.applyBatch(makeBatch(3, 3000, {
        makeEvent(kTemperature, Classification::Changed, std::int64_t(21), 3000),
    })));
    entry = registry.entry({kHeater, kTemperature});
    QVERIFY(entry->available);
    QCOMPARE(entry->lastSeenMs, std::int64_t(3000));
    QCOMPARE(entry->lastChangedMs, std::int64_t(1000));

    QCOMPARE(availabilitySpy.count(), 2);
    QCOMPARE(availabilitySpy.at(0).at(1).toBool(), false);
    QCOMPARE(availabilitySpy.at(1).at(1).toBool(), true);
}

void EntityRegistryTest::staleBatchesAreIgnored()
{
    EntityRegistry registry;
    QVERIFY(registry.applyBatch(makeBatch(5, 5000, {
        makeEvent(kTemperature, Classification::New, std::int64_t(25), 5000),
    })));
    QVERIFY(registry.applyBatch(makeBatch(4, 4000, {
        makeEvent(kTemperature, Classification::Changed, std::int64_t(24), 4000),
    })));

    const RegistryEntry entry = *registry.entry({kHeater, kTemperature});
    QCOMPARE(std::get<std::int64_t>(entry.lastValue), std::int64_t(25));
    QCOMPARE(entry.lastSequence, std::uint64_t(5));
}

void EntityRegistryTest::unchangedKeysRefreshLastSeen()
{
    EntityRegistry registry;
    QVERIFY(registry.applyBatch(makeBatch(1, 1000, {
        makeEvent(kTemperature, Classification::New, std::int64_t(21), 1000),
    })));

    DiscoveryBatch quiet = makeBatch(2, 2000, {});
    auto snapshot = std::make_shared<Snapshot>(*quiet.snapshot);
    StateEntry state;
    state.name = kTemperature;
    state.value = std::int64_t(21);
    snapshot->devices[kHeater].states.append(state);
    quiet.snapshot = snapshot;
    quiet.unchangedCount = 1;

    QVERIFY(registry.applyBatch(quiet));
    const RegistryEntry entry = *registry.entry({kHeater, kTemperature});
    QCOMPARE(entry.lastSeenMs, std::int64_t(2000));
    QCOMPARE(entry.lastChangedMs, std::int64_t(1000));
}

void EntityRegistryTest::lookupHelpers()
{
    EntityRegistry registry;
    QVERIFY(registry.applyBatch(makeBatch(1, 1000, {
        makeEvent(kTemperature, Classification::New, std::int64_t(21), 1000),
        makeEvent(kOnOff, Classification::New, QStringLiteral("on"), 1000),
    })));

    const QList<DiscoveryKey> keys = registry.knownKeys();
    QCOMPARE(keys.size(), 2);
    QCOMPARE(keys.first().field, kOnOff);

    const QList<RegistryEntry> forDevice = registry.entriesForDevice(kHeater);
    QCOMPARE(forDevice.size(), 2);
    QCOMPARE(forDevice.first().key.field, kOnOff);
    QVERIFY(registry.entriesForDevice(QStringLiteral("io://other/1")).isEmpty());

    const std::optional<RegistryEntry> byHandle = registry.entryByHandle(forDevice.last().handle);
    QVERIFY(byHandle.has_value());
    QCOMPARE(byHandle->key.field, kTemperature);
    QVERIFY(!registry.entryByHandle(42).has_value());
    QVERIFY(!registry.entry({kHeater, QStringLiteral("core:NameState")}).has_value());
}

QTEST_GUILESS_MAIN(EntityRegistryTest)

#include "tst_entityregistry.moc"
