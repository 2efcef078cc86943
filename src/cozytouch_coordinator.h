#pragma once

#include <cstdint>

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>

#include "cozytouch_backoff.h"
#include "cozytouch_gateway.h"
#include "cozytouch_model.h"
#include "cozytouch_snapshot.h"

namespace phicore::cozytouch {

// Consumer of classified batches. Returning false (with an error text) or
// throwing a std::exception is logged by the coordinator; the remaining
// observers still run and the snapshot is committed regardless.
class DiscoveryObserver
{
public:
    virtual ~DiscoveryObserver() = default;

    virtual bool applyBatch(const DiscoveryBatch &batch, QString *error = nullptr) = 0;
};

enum class CoordinatorState {
    Stopped,
    Idle,
    Polling,
    Diffing,
    Publishing,
    Backoff,
    Suspended
};

const char *coordinatorStateName(CoordinatorState state);

struct CoordinatorStatus {
    CoordinatorState state = CoordinatorState::Stopped;
    std::uint64_t sequence = 0;
    int consecutiveFailures = 0;
    bool degraded = false;
    QString lastError;
    ApiStatus lastErrorKind = ApiStatus::Ok;
    std::int64_t lastAttemptMs = 0;
    std::int64_t lastSuccessMs = 0;
    std::uint64_t totalCycles = 0;
    std::uint64_t coalescedRefreshes = 0;
    int nextDelayMs = 0;

    QJsonObject toJson() const;
};

// Owns the poll loop of one account: gateway -> snapshot builder -> diff
// against the committed snapshot -> one sorted batch to every observer.
// Lives on the thread of its event loop; status() and currentSnapshot() may be
// called from any thread.
class DiscoveryCoordinator : public QObject
{
    Q_OBJECT

public:
    explicit DiscoveryCoordinator(ApiGateway *gateway, QObject *parent = nullptr);
    ~DiscoveryCoordinator() override;

    void setBackoffPolicy(const BackoffPolicy &policy);
    BackoffPolicy backoffPolicy() const { return m_policy; }
    void setMaxConsecutiveFailures(int count);

    void addObserver(DiscoveryObserver *observer);
    void removeObserver(DiscoveryObserver *observer);

    void start(bool pollImmediately = true);
    void stop();

    // Polls now from Idle or Backoff. While a cycle is running the request
    // is coalesced into it; Stopped and Suspended ignore it.
    void forceRefresh();

    // Logs in again after an auth failure and resumes with an immediate poll.
    bool reauthenticate(QString *error = nullptr);

    CoordinatorState state() const;
    CoordinatorStatus status() const;
    SnapshotPtr currentSnapshot() const;

signals:
    void stateChanged(phicore::cozytouch::CoordinatorState state);
    void batchPublished(const phicore::cozytouch::DiscoveryBatch &batch);
    void degradedChanged(bool degraded);
    void authenticationRequired(const QString &error);
    void pollFailed(phicore::cozytouch::ApiStatus status, const QString &error);

private:
    bool runCycle();
    DiscoveryBatch diff(const SnapshotPtr &snapshot, QSet<DiscoveryKey> *presentKeys) const;
    void publish(const DiscoveryBatch &batch);
    void commit(const SnapshotPtr &snapshot, const DiscoveryBatch &batch, QSet<DiscoveryKey> presentKeys);
    void handleFailure(ApiStatus status, const QString &error);
    void scheduleNext(int delayMs);
    void setState(CoordinatorState state);
    void setDegraded(bool degraded);

    ApiGateway *m_gateway = nullptr;
    SnapshotBuilder m_builder;
    BackoffPolicy m_policy;
    int m_maxConsecutiveFailures = 5;
    QList<DiscoveryObserver *> m_observers;
    QTimer m_pollTimer;
    bool m_cycleActive = false;

    // Diff state, touched only by the cycle.
    QSet<DiscoveryKey> m_everSeen;
    QSet<DiscoveryKey> m_present;
    QSet<DiscoveryKey> m_missing;
    QHash<DiscoveryKey, StateValue> m_lastValues;

    mutable QMutex m_mutex;
    SnapshotPtr m_snapshot;
    CoordinatorStatus m_status;
};

} // namespace phicore::cozytouch

Q_DECLARE_METATYPE(phicore::cozytouch::CoordinatorState)
Q_DECLARE_METATYPE(phicore::cozytouch::ApiStatus)
