#pragma once

#include <cstdint>
#include <vector>

#include <QByteArray>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QTimer>

#include "cozytouch_backoff.h"
#include "cozytouch_gateway.h"
#include "cozytouch_model.h"

namespace phicore::cozytouch {

// Bounded buffer of recent remote events plus the fetch loop that fills it.
// record() and recent() are safe from any thread.
class EventTracker : public QObject
{
    Q_OBJECT

public:
    explicit EventTracker(ApiGateway *gateway, int capacity = 50, QObject *parent = nullptr);

    void setCapacity(int capacity);
    void setBackoffPolicy(const BackoffPolicy &policy);
    void setMaxConsecutiveFailures(int count);

    void start(bool fetchImmediately = true);
    void stop();
    void resume();
    bool isRunning() const { return m_running; }
    bool isSuspended() const { return m_suspended; }

    // One fetch through the gateway; recorded events are returned in arrival order.
    ApiStatus pollOnce(QList<RemoteEvent> *fetched = nullptr, QString *error = nullptr);

    RemoteEvent record(RemoteEvent event);
    QList<RemoteEvent> recent() const;

    int size() const;
    int capacity() const;
    std::uint64_t totalRecorded() const;
    int consecutiveFailures() const { return m_consecutiveFailures; }
    int nextDelayMs() const { return m_nextDelayMs; }
    std::int64_t lastEventMs() const { return m_lastEventMs; }

    static bool isDeviceChangeEvent(const QString &name);
    static bool parseEvents(const QByteArray &payload, QList<RemoteEvent> *out, QString *error = nullptr);

signals:
    void eventRecorded(const phicore::cozytouch::RemoteEvent &event);
    void refreshHint(const QString &deviceId, const QString &eventName);
    void authenticationRequired(const QString &error);
    void degradedChanged(bool degraded);

private:
    void onTimer();
    void scheduleNext(int delayMs);

    ApiGateway *m_gateway = nullptr;
    BackoffPolicy m_policy;
    int m_maxConsecutiveFailures = 5;
    QTimer m_timer;
    bool m_running = false;
    bool m_suspended = false;
    bool m_degraded = false;
    int m_consecutiveFailures = 0;
    int m_nextDelayMs = 0;
    std::int64_t m_lastEventMs = 0;

    mutable QMutex m_mutex;
    std::vector<RemoteEvent> m_ring;
    int m_head = 0;
    int m_size = 0;
    std::uint64_t m_total = 0;
};

} // namespace phicore::cozytouch
