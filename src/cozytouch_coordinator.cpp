#include "cozytouch_coordinator.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <QDateTime>
#include <QMutexLocker>

#include "cozytouch_log.h"

namespace phicore::cozytouch {

namespace {

std::int64_t nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

} // namespace

const char *coordinatorStateName(CoordinatorState state)
{
    switch (state) {
    case CoordinatorState::Stopped:
        return "stopped";
    case CoordinatorState::Idle:
        return "idle";
    case CoordinatorState::Polling:
        return "polling";
    case CoordinatorState::Diffing:
        return "diffing";
    case CoordinatorState::Publishing:
        return "publishing";
    case CoordinatorState::Backoff:
        return "backoff";
    case CoordinatorState::Suspended:
        return "suspended";
    }
    return "unknown";
}

QJsonObject CoordinatorStatus::toJson() const
{
    QJsonObject out;
    out.insert(QStringLiteral("state"), QString::fromLatin1(coordinatorStateName(state)));
    out.insert(QStringLiteral("sequence"), static_cast<qint64>(sequence));
    out.insert(QStringLiteral("consecutive_failures"), consecutiveFailures);
    out.insert(QStringLiteral("degraded"), degraded);
    out.insert(QStringLiteral("last_error"), lastError);
    out.insert(QStringLiteral("last_error_kind"), QString::fromLatin1(apiStatusName(lastErrorKind)));
    out.insert(QStringLiteral("last_attempt_ms"), static_cast<qint64>(lastAttemptMs));
    out.insert(QStringLiteral("last_success_ms"), static_cast<qint64>(lastSuccessMs));
    out.insert(QStringLiteral("total_cycles"), static_cast<qint64>(totalCycles));
    out.insert(QStringLiteral("coalesced_refreshes"), static_cast<qint64>(coalescedRefreshes));
    out.insert(QStringLiteral("next_delay_ms"), nextDelayMs);
    return out;
}

DiscoveryCoordinator::DiscoveryCoordinator(ApiGateway *gateway, QObject *parent)
    : QObject(parent)
    , m_gateway(gateway)
{
    m_pollTimer.setSingleShot(true);
    connect(&m_pollTimer, &QTimer::timeout, this, [this]() {
        runCycle();
    });
}

DiscoveryCoordinator::~DiscoveryCoordinator() = default;

void DiscoveryCoordinator::setBackoffPolicy(const BackoffPolicy &policy)
{
    m_policy = policy;
}

void DiscoveryCoordinator::setMaxConsecutiveFailures(int count)
{
    m_maxConsecutiveFailures = std::max(1, count);
}

void DiscoveryCoordinator::addObserver(DiscoveryObserver *observer)
{
    if (observer && !m_observers.contains(observer))
        m_observers.append(observer);
}

void DiscoveryCoordinator::removeObserver(DiscoveryObserver *observer)
{
    m_observers.removeAll(observer);
}

void DiscoveryCoordinator::start(bool pollImmediately)
{
    if (state() != CoordinatorState::Stopped)
        return;

    setState(CoordinatorState::Idle);
    qCInfo(coordinatorLog) << "Discovery started, interval" << m_policy.baseMs << "ms";
    scheduleNext(pollImmediately ? 0 : m_policy.baseMs);
}

void DiscoveryCoordinator::stop()
{
    m_pollTimer.stop();
    if (state() == CoordinatorState::Stopped)
        return;
    setState(CoordinatorState::Stopped);
    qCInfo(coordinatorLog) << "Discovery stopped";
}

void DiscoveryCoordinator::forceRefresh()
{
    const CoordinatorState current = state();
    if (current == CoordinatorState::Stopped || current == CoordinatorState::Suspended) {
        qCDebug(coordinatorLog) << "Refresh ignored in state" << coordinatorStateName(current);
        return;
    }

    if (m_cycleActive) {
        QMutexLocker locker(&m_mutex);
        ++m_status.coalescedRefreshes;
        qCDebug(coordinatorLog) << "Refresh coalesced into the running cycle";
        return;
    }

    runCycle();
}

bool DiscoveryCoordinator::reauthenticate(QString *error)
{
    if (state() == CoordinatorState::Stopped) {
        if (error)
            *error = QStringLiteral("Discovery is stopped");
        return false;
    }
    if (m_cycleActive) {
        if (error)
            *error = QStringLiteral("A poll cycle is in progress");
        return false;
    }
    if (!m_gateway) {
        if (error)
            *error = QStringLiteral("No API gateway configured");
        return false;
    }

    QString loginError;
    const ApiStatus status = m_gateway->login(&loginError);
    if (status != ApiStatus::Ok) {
        qCWarning(coordinatorLog).noquote() << "Re-authentication failed:" << apiStatusName(status) << loginError;
        {
            QMutexLocker locker(&m_mutex);
            m_status.lastError = loginError;
            m_status.lastErrorKind = status;
        }
        if (error)
            *error = loginError;
        return false;
    }

    qCInfo(coordinatorLog) << "Re-authenticated, resuming discovery";
    setState(CoordinatorState::Idle);
    runCycle();
    if (error)
        error->clear();
    return true;
}

CoordinatorState DiscoveryCoordinator::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_status.state;
}

CoordinatorStatus DiscoveryCoordinator::status() const
{
    QMutexLocker locker(&m_mutex);
    return m_status;
}

SnapshotPtr DiscoveryCoordinator::currentSnapshot() const
{
    QMutexLocker locker(&m_mutex);
    return m_snapshot;
}

bool DiscoveryCoordinator::runCycle()
{
    const CoordinatorState current = state();
    if (current == CoordinatorState::Stopped || current == CoordinatorState::Suspended)
        return false;
    if (m_cycleActive)
        return false;

    m_cycleActive = true;
    m_pollTimer.stop();

    const std::int64_t startedMs = nowMs();
    {
        QMutexLocker locker(&m_mutex);
        ++m_status.totalCycles;
        m_status.lastAttemptMs = startedMs;
    }
    setState(CoordinatorState::Polling);

    QByteArray payload;
    QString error;
    ApiStatus status = m_gateway
        ? m_gateway->listDevices(&payload, &error)
        : ApiStatus::TransportError;
    if (!m_gateway)
        error = QStringLiteral("No API gateway configured");

    // stop() may have been called from a nested event loop.
    if (state() == CoordinatorState::Stopped) {
        m_cycleActive = false;
        return false;
    }

    auto snapshot = std::make_shared<Snapshot>();
    if (status == ApiStatus::Ok) {
        setState(CoordinatorState::Diffing);
        if (!m_builder.build(payload, startedMs, snapshot.get(), &error))
            status = ApiStatus::MalformedPayload;
    }

    if (status != ApiStatus::Ok) {
        handleFailure(status, error);
        m_cycleActive = false;
        return false;
    }

    const SnapshotPtr committed = std::move(snapshot);
    QSet<DiscoveryKey> presentKeys;
    const DiscoveryBatch batch = diff(committed, &presentKeys);

    setState(CoordinatorState::Publishing);
    publish(batch);
    commit(committed, batch, std::move(presentKeys));

    qCDebug(coordinatorLog).noquote()
        << "Cycle" << batch.sequence << "devices:" << committed->devices.size()
        << "events:" << batch.events.size() << "unchanged:" << batch.unchangedCount;

    setDegraded(false);
    setState(CoordinatorState::Idle);
    scheduleNext(m_policy.delayFor(0));
    m_cycleActive = false;

    emit batchPublished(batch);
    return true;
}

DiscoveryBatch DiscoveryCoordinator::diff(const SnapshotPtr &snapshot, QSet<DiscoveryKey> *presentKeys) const
{
    DiscoveryBatch batch;
    batch.sequence = snapshot->sequence;
    batch.timestampMs = snapshot->timestampMs;
    batch.snapshot = snapshot;

    for (const Device &device : snapshot->devices) {
        for (const StateEntry &state : device.states) {
            const DiscoveryKey key{device.id, state.name};
            presentKeys->insert(key);

            DiscoveryEvent event;
            event.key = key;
            event.value = state.value;
            event.timestampMs = snapshot->timestampMs;

            if (!m_everSeen.contains(key)) {
                event.classification = Classification::New;
            } else {
                const auto last = m_lastValues.constFind(key);
                const bool reappeared = m_missing.contains(key);
                if (!reappeared && last != m_lastValues.constEnd() && *last == state.value) {
                    ++batch.unchangedCount;
                    continue;
                }
                event.classification = Classification::Changed;
                if (last != m_lastValues.constEnd())
                    event.previousValue = *last;
            }
            batch.events.append(std::move(event));
        }
    }

    for (const DiscoveryKey &key : m_present) {
        if (presentKeys->contains(key) || m_missing.contains(key))
            continue;
        DiscoveryEvent event;
        event.key = key;
        event.classification = Classification::Missing;
        event.value = m_lastValues.value(key);
        event.previousValue = event.value;
        event.timestampMs = snapshot->timestampMs;
        batch.events.append(std::move(event));
    }

    std::sort(batch.events.begin(), batch.events.end(), [](const DiscoveryEvent &lhs, const DiscoveryEvent &rhs) {
        return lhs.key < rhs.key;
    });
    return batch;
}

void DiscoveryCoordinator::publish(const DiscoveryBatch &batch)
{
    const QList<DiscoveryObserver *> observers = m_observers;
    for (DiscoveryObserver *observer : observers) {
        try {
            QString error;
            if (!observer->applyBatch(batch, &error)) {
                qCWarning(coordinatorLog).noquote()
                    << "Observer rejected batch" << batch.sequence << ":" << error;
            }
        } catch (const std::exception &e) {
            qCWarning(coordinatorLog).noquote()
                << "Observer threw on batch" << batch.sequence << ":" << e.what();
        }
    }
}

void DiscoveryCoordinator::commit(const SnapshotPtr &snapshot,
                                  const DiscoveryBatch &batch,
                                  QSet<DiscoveryKey> presentKeys)
{
    for (const DiscoveryEvent &event : batch.events) {
        switch (event.classification) {
        case Classification::New:
        case Classification::Changed:
            m_everSeen.insert(event.key);
            m_missing.remove(event.key);
            m_lastValues.insert(event.key, event.value);
            break;
        case Classification::Missing:
            m_missing.insert(event.key);
            break;
        case Classification::Unchanged:
            break;
        }
    }
    m_present = std::move(presentKeys);

    QMutexLocker locker(&m_mutex);
    m_snapshot = snapshot;
    m_status.sequence = snapshot->sequence;
    m_status.consecutiveFailures = 0;
    m_status.lastSuccessMs = snapshot->timestampMs;
    m_status.lastError.clear();
    m_status.lastErrorKind = ApiStatus::Ok;
}

void DiscoveryCoordinator::handleFailure(ApiStatus status, const QString &error)
{
    int failures = 0;
    {
        QMutexLocker locker(&m_mutex);
        failures = ++m_status.consecutiveFailures;
        m_status.lastError = error;
        m_status.lastErrorKind = status;
    }

    emit pollFailed(status, error);

    if (status == ApiStatus::AuthError) {
        qCWarning(coordinatorLog).noquote() << "Authentication failed, discovery suspended:" << error;
        m_pollTimer.stop();
        {
            QMutexLocker locker(&m_mutex);
            m_status.nextDelayMs = 0;
        }
        setState(CoordinatorState::Suspended);
        emit authenticationRequired(error);
        return;
    }

    const int delay = m_policy.delayFor(failures);
    qCWarning(coordinatorLog).noquote()
        << "Poll failed (" << apiStatusName(status) << "):" << error
        << "- failure" << failures << ", retry in" << delay << "ms";

    if (failures >= m_maxConsecutiveFailures)
        setDegraded(true);

    setState(CoordinatorState::Backoff);
    scheduleNext(delay);
}

void DiscoveryCoordinator::scheduleNext(int delayMs)
{
    {
        QMutexLocker locker(&m_mutex);
        m_status.nextDelayMs = delayMs;
    }
    m_pollTimer.start(std::max(0, delayMs));
}

void DiscoveryCoordinator::setState(CoordinatorState state)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_status.state == state)
            return;
        m_status.state = state;
    }
    emit stateChanged(state);
}

void DiscoveryCoordinator::setDegraded(bool degraded)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_status.degraded == degraded)
            return;
        m_status.degraded = degraded;
    }
    if (degraded)
        qCWarning(coordinatorLog) << "Discovery degraded after" << m_maxConsecutiveFailures << "consecutive failures";
    else
        qCInfo(coordinatorLog) << "Discovery recovered";
    emit degradedChanged(degraded);
}

} // namespace phicore::cozytouch
