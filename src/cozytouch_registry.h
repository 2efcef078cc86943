#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <QHash>
#include <QList>
#include <QObject>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>

#include "cozytouch_coordinator.h"
#include "cozytouch_model.h"

namespace phicore::cozytouch {

enum class EntityKind {
    Sensor,
    BinarySensor
};

const char *entityKindName(EntityKind kind);

struct EntityDescriptor {
    EntityKind kind = EntityKind::Sensor;
    QString uniqueId;
    QString name;
    QString deviceClass;
    QString unit;
    QString stateClass;
    // Lower-case textual values that read as "on" for binary sensors.
    QStringList onValues;
};

struct RegistryEntry {
    DiscoveryKey key;
    int handle = -1;
    EntityDescriptor descriptor;
    StateValue lastValue;
    std::int64_t firstSeenMs = 0;
    std::int64_t lastSeenMs = 0;
    std::int64_t lastChangedMs = 0;
    std::uint64_t lastSequence = 0;
    bool available = true;
};

// Typing is decided once, from the first value seen.
EntityDescriptor describeEntity(const QString &deviceId,
                                const QString &deviceLabel,
                                const QString &field,
                                const StateValue &firstValue);
bool isOnValue(const EntityDescriptor &descriptor, const StateValue &value);

// One long-lived entity per DiscoveryKey. Entries are created once, updated in
// place and never removed; a key that disappears only turns unavailable.
// Handles are stable indices into the arena.
class EntityRegistry : public QObject, public DiscoveryObserver
{
    Q_OBJECT

public:
    explicit EntityRegistry(QObject *parent = nullptr);

    bool applyBatch(const DiscoveryBatch &batch, QString *error = nullptr) override;

    std::optional<RegistryEntry> entry(const DiscoveryKey &key) const;
    std::optional<RegistryEntry> entryByHandle(int handle) const;
    QList<RegistryEntry> entries() const;
    QList<RegistryEntry> entriesForDevice(const QString &deviceId) const;
    QList<DiscoveryKey> knownKeys() const;

    int size() const;
    int availableCount() const;

signals:
    void entityCreated(int handle);
    void entityUpdated(int handle);
    void availabilityChanged(int handle, bool available);

private:
    struct Notification {
        enum Kind {
            Created,
            Updated,
            Availability
        } kind;
        int handle;
        bool available;
    };

    mutable QReadWriteLock m_lock;
    std::vector<RegistryEntry> m_entries;
    QHash<DiscoveryKey, int> m_index;
};

} // namespace phicore::cozytouch
