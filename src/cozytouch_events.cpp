#include "cozytouch_events.h"

#include <algorithm>
#include <utility>

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>

#include "cozytouch_log.h"

namespace phicore::cozytouch {

EventTracker::EventTracker(ApiGateway *gateway, int capacity, QObject *parent)
    : QObject(parent)
    , m_gateway(gateway)
{
    m_ring.resize(static_cast<std::size_t>(std::max(1, capacity)));
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &EventTracker::onTimer);
}

void EventTracker::setCapacity(int capacity)
{
    capacity = std::max(1, capacity);
    QMutexLocker locker(&m_mutex);
    if (capacity == static_cast<int>(m_ring.size()))
        return;

    // Keep the newest entries that still fit, oldest first.
    const int keep = std::min(m_size, capacity);
    const int oldCapacity = static_cast<int>(m_ring.size());
    std::vector<RemoteEvent> resized(static_cast<std::size_t>(capacity));
    for (int i = 0; i < keep; ++i) {
        const int from = (m_head - keep + i + oldCapacity) % oldCapacity;
        resized[static_cast<std::size_t>(i)] = std::move(m_ring[static_cast<std::size_t>(from)]);
    }
    m_ring = std::move(resized);
    m_size = keep;
    m_head = keep % capacity;
}

void EventTracker::setBackoffPolicy(const BackoffPolicy &policy)
{
    m_policy = policy;
}

void EventTracker::setMaxConsecutiveFailures(int count)
{
    m_maxConsecutiveFailures = std::max(1, count);
}

void EventTracker::start(bool fetchImmediately)
{
    if (m_running)
        return;
    m_running = true;
    m_suspended = false;
    scheduleNext(fetchImmediately ? 0 : m_policy.baseMs);
}

void EventTracker::stop()
{
    m_running = false;
    m_timer.stop();
}

void EventTracker::resume()
{
    if (!m_suspended)
        return;
    m_suspended = false;
    qCInfo(eventsLog) << "Event fetching resumed";
    if (m_running)
        scheduleNext(0);
}

RemoteEvent EventTracker::record(RemoteEvent event)
{
    QMutexLocker locker(&m_mutex);
    const int capacity = static_cast<int>(m_ring.size());
    event.sequence = ++m_total;
    m_ring[static_cast<std::size_t>(m_head)] = event;
    m_head = (m_head + 1) % capacity;
    m_size = std::min(m_size + 1, capacity);
    return event;
}

QList<RemoteEvent> EventTracker::recent() const
{
    QMutexLocker locker(&m_mutex);
    const int capacity = static_cast<int>(m_ring.size());
    QList<RemoteEvent> out;
    out.reserve(m_size);
    for (int i = 0; i < m_size; ++i) {
        const int index = (m_head - 1 - i + capacity) % capacity;
        out.append(m_ring[static_cast<std::size_t>(index)]);
    }
    return out;
}

int EventTracker::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_size;
}

int EventTracker::capacity() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_ring.size());
}

std::uint64_t EventTracker::totalRecorded() const
{
    QMutexLocker locker(&m_mutex);
    return m_total;
}

bool EventTracker::isDeviceChangeEvent(const QString &name)
{
    return name == QLatin1String("DeviceStateChangedEvent")
        || name == QLatin1String("DeviceCreatedEvent")
        || name == QLatin1String("DeviceUpdatedEvent")
        || name == QLatin1String("DeviceRemovedEvent")
        || name == QLatin1String("DeviceAvailableEvent")
        || name == QLatin1String("DeviceUnavailableEvent");
}

bool EventTracker::parseEvents(const QByteArray &payload, QList<RemoteEvent> *out, QString *error)
{
    if (!out)
        return false;
    out->clear();

    if (payload.trimmed().isEmpty())
        return true;

    QJsonParseError parseError;
    const QJsonDocument doc = parseJsonPayload(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        if (error)
            *error = QStringLiteral("Event payload is not a JSON array");
        return false;
    }

    const QJsonArray events = doc.array();
    for (const QJsonValue &value : events) {
        if (!value.isObject()) {
            qCDebug(eventsLog) << "Skipping non-object event entry";
            continue;
        }
        const QJsonObject obj = value.toObject();
        RemoteEvent event;
        event.name = obj.value(QStringLiteral("name")).toString().trimmed();
        event.deviceId = obj.value(QStringLiteral("deviceURL")).toString().trimmed();
        event.timestampMs = static_cast<std::int64_t>(obj.value(QStringLiteral("timestamp")).toDouble(0));
        event.payload = obj;
        out->append(std::move(event));
    }

    if (error)
        error->clear();
    return true;
}

ApiStatus EventTracker::pollOnce(QList<RemoteEvent> *fetched, QString *error)
{
    QByteArray payload;
    QString fetchError;
    ApiStatus status = m_gateway
        ? m_gateway->fetchEvents(m_lastEventMs, &payload, &fetchError)
        : ApiStatus::TransportError;
    if (!m_gateway)
        fetchError = QStringLiteral("No API gateway configured");

    QList<RemoteEvent> events;
    if (status == ApiStatus::Ok && !parseEvents(payload, &events, &fetchError))
        status = ApiStatus::MalformedPayload;

    if (status != ApiStatus::Ok) {
        ++m_consecutiveFailures;
        if (error)
            *error = fetchError;

        if (status == ApiStatus::AuthError) {
            qCWarning(eventsLog).noquote() << "Event fetching suspended:" << fetchError;
            m_suspended = true;
            m_timer.stop();
            emit authenticationRequired(fetchError);
        } else {
            qCWarning(eventsLog).noquote()
                << "Event fetch failed (" << apiStatusName(status) << "):" << fetchError;
            if (m_consecutiveFailures >= m_maxConsecutiveFailures && !m_degraded) {
                m_degraded = true;
                emit degradedChanged(true);
            }
        }
        return status;
    }

    m_consecutiveFailures = 0;
    if (m_degraded) {
        m_degraded = false;
        emit degradedChanged(false);
    }

    // Local stamps never move the since cursor.
    const std::int64_t now = QDateTime::currentMSecsSinceEpoch();
    QList<RemoteEvent> recorded;
    for (RemoteEvent &event : events) {
        if (event.timestampMs > 0)
            m_lastEventMs = std::max(m_lastEventMs, event.timestampMs);
        else
            event.timestampMs = now;
        recorded.append(record(std::move(event)));
    }

    if (!recorded.isEmpty())
        qCDebug(eventsLog) << "Recorded" << recorded.size() << "events";

    for (const RemoteEvent &event : std::as_const(recorded)) {
        emit eventRecorded(event);
        if (isDeviceChangeEvent(event.name))
            emit refreshHint(event.deviceId, event.name);
    }

    if (fetched)
        *fetched = recorded;
    if (error)
        error->clear();
    return ApiStatus::Ok;
}

void EventTracker::onTimer()
{
    if (!m_running || m_suspended)
        return;

    pollOnce();
    if (!m_running || m_suspended)
        return;
    scheduleNext(m_policy.delayFor(m_consecutiveFailures));
}

void EventTracker::scheduleNext(int delayMs)
{
    m_nextDelayMs = delayMs;
    m_timer.start(std::max(0, delayMs));
}

} // namespace phicore::cozytouch
