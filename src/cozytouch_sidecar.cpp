#include "cozytouch_sidecar.h"

#include <iostream>

#include <QDateTime>
#include <QJsonDocument>
#include <QMap>
#include <QTimer>

#include "cozytouch_channels.h"
#include "cozytouch_log.h"
#include "cozytouch_schema.h"

namespace phicore::cozytouch::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

QJsonObject parseObject(const std::string &json)
{
    const QByteArray bytes = QByteArray::fromStdString(json);
    if (bytes.trimmed().isEmpty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes);
    return doc.isObject() ? doc.object() : QJsonObject{};
}

const RegistryEntry *findEntry(const QList<RegistryEntry> &entries, const QString &field)
{
    for (const RegistryEntry &entry : entries) {
        if (entry.key.field == field)
            return &entry;
    }
    return nullptr;
}

} // namespace

CozytouchSidecar::CozytouchSidecar() = default;

CozytouchSidecar::~CozytouchSidecar()
{
    stopPipeline();
}

void CozytouchSidecar::onConnected()
{
    std::cerr << "cozytouch-ipc connected" << '\n';
}

void CozytouchSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "cozytouch-ipc disconnected" << '\n';
}

void CozytouchSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);
    stopPipeline();
    applyBootstrapAdapter(request.adapter);
    m_hasBootstrap = true;

    std::cerr << "cozytouch-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " server=" << m_config.server.toStdString()
              << " pollIntervalSec=" << m_config.pollIntervalSec
              << '\n';

    if (!m_config.hasCredentials()) {
        reportError(QStringLiteral("Cozytouch username and password are required"));
        return;
    }
    startPipeline();
}

phicore::adapter::v1::CmdResponse CozytouchSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    return failureResponse(request.cmdId,
                           CmdStatus::NotImplemented,
                           QStringLiteral("Cozytouch channels are read-only"));
}

phicore::adapter::v1::ActionResponse CozytouchSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request);
    if (actionId == QLatin1String("refresh"))
        return invokeRefresh(request);
    if (actionId == QLatin1String("exportDiagnostics"))
        return invokeExportDiagnostics(request);

    ActionResponse resp;
    resp.id = request.cmdId;
    resp.status = CmdStatus::NotImplemented;
    resp.error = "Unsupported adapter action";
    resp.tsMs = nowMs();
    return resp;
}

bool CozytouchSidecar::applyBatch(const DiscoveryBatch &batch, QString *error)
{
    if (!m_registry)
        return true;

    QMap<QString, QList<const DiscoveryEvent *>> eventsByDevice;
    for (const DiscoveryEvent &event : batch.events)
        eventsByDevice[event.key.deviceId].append(&event);
    if (!m_fullSyncSent && batch.snapshot) {
        for (const Device &device : batch.snapshot->devices)
            eventsByDevice[device.id];
    }

    v1::Utf8String sendError;
    for (auto it = eventsByDevice.cbegin(); it != eventsByDevice.cend(); ++it) {
        const QString &deviceId = it.key();
        const Device *device = nullptr;
        if (batch.snapshot) {
            const auto found = batch.snapshot->devices.constFind(deviceId);
            if (found != batch.snapshot->devices.constEnd())
                device = &found.value();
        }

        const QList<RegistryEntry> entries = m_registry->entriesForDevice(deviceId);
        if (entries.isEmpty() && !device)
            continue;

        const DeviceEntry entry = buildDeviceEntry(deviceId, device, entries);
        if (!sendDeviceUpdated(entry.device, entry.channels, &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }

        for (const DiscoveryEvent *event : it.value()) {
            if (event->classification == Classification::Missing)
                continue;
            const RegistryEntry *registryEntry = findEntry(entries, event->key.field);
            if (!registryEntry)
                continue;
            if (!sendChannelStateUpdated(entry.device.externalId,
                                         event->key.field.toStdString(),
                                         toScalarValue(*registryEntry, event->value),
                                         event->timestampMs,
                                         &sendError)) {
                if (error)
                    *error = QString::fromStdString(sendError);
                return false;
            }
        }
    }

    if (!m_fullSyncSent) {
        if (!sendFullSyncCompleted(&sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }
        m_fullSyncSent = true;
    }

    setConnectionState(true);
    return true;
}

phicore::adapter::v1::Utf8String CozytouchSidecar::displayName() const
{
    return phicore::cozytouch::ipc::displayName();
}

phicore::adapter::v1::Utf8String CozytouchSidecar::description() const
{
    return phicore::cozytouch::ipc::description();
}

phicore::adapter::v1::Utf8String CozytouchSidecar::iconSvg() const
{
    return phicore::cozytouch::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String CozytouchSidecar::apiVersion() const
{
    return "1.0.0";
}

int CozytouchSidecar::timeoutMs() const
{
    // Covers a full login (three requests) plus the setup read.
    return 4 * m_config.requestTimeoutMs;
}

phicore::adapter::v1::AdapterCapabilities CozytouchSidecar::capabilities() const
{
    return phicore::cozytouch::ipc::capabilities();
}

phicore::adapter::v1::JsonText CozytouchSidecar::configSchemaJson() const
{
    return phicore::cozytouch::ipc::configSchemaJson();
}

std::int64_t CozytouchSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

void CozytouchSidecar::applyBootstrapAdapter(const v1::Adapter &adapter)
{
    m_meta = parseObject(adapter.metaJson);
    m_config = CozytouchConfig::fromJson(m_meta);
}

void CozytouchSidecar::startPipeline()
{
    m_gateway = std::make_unique<OverkizGateway>(&m_network, m_config);
    // Coordinator and tracker share one session; HTTP waits spin a nested
    // event loop in which either timer may fire.
    m_exclusive = std::make_unique<ExclusiveGateway>(m_gateway.get());
    m_registry = std::make_unique<EntityRegistry>();

    m_coordinator = std::make_unique<DiscoveryCoordinator>(m_exclusive.get());
    m_coordinator->setBackoffPolicy(m_config.pollBackoff());
    m_coordinator->setMaxConsecutiveFailures(m_config.maxConsecutiveFailures);
    // Registry first: the sidecar reads it while publishing.
    m_coordinator->addObserver(m_registry.get());
    m_coordinator->addObserver(this);

    m_tracker = std::make_unique<EventTracker>(m_exclusive.get(), m_config.eventBufferCapacity);
    m_tracker->setBackoffPolicy(m_config.eventBackoff());
    m_tracker->setMaxConsecutiveFailures(m_config.maxConsecutiveFailures);

    m_exporter = std::make_unique<DiagnosticsExporter>(m_coordinator.get(), m_tracker.get(), m_registry.get());
    m_exporter->setConfig(m_config);

    DiscoveryCoordinator *coordinator = m_coordinator.get();
    EventTracker *tracker = m_tracker.get();

    QObject::connect(coordinator, &DiscoveryCoordinator::authenticationRequired, coordinator, [this](const QString &error) {
        setConnectionState(false);
        reportError(QStringLiteral("Cozytouch login failed, run probe after fixing the credentials: %1").arg(error));
    });
    QObject::connect(coordinator, &DiscoveryCoordinator::degradedChanged, coordinator, [this, coordinator](bool degraded) {
        if (!degraded)
            return;
        setConnectionState(false);
        reportError(QStringLiteral("Cozytouch cloud unreachable: %1").arg(coordinator->status().lastError));
    });
    QObject::connect(coordinator, &DiscoveryCoordinator::batchPublished, tracker, [tracker](const DiscoveryBatch &) {
        tracker->resume();
    });

    if (m_config.refreshOnEvents) {
        // Several device events in one fetch end up as a single refresh.
        auto pending = std::make_shared<bool>(false);
        QObject::connect(tracker, &EventTracker::refreshHint, coordinator, [coordinator, pending](const QString &, const QString &) {
            if (*pending)
                return;
            *pending = true;
            QTimer::singleShot(0, coordinator, [coordinator, pending]() {
                *pending = false;
                coordinator->forceRefresh();
            });
        });
    }

    m_coordinator->start(true);
    m_tracker->start(false);
    qCInfo(adapterLog).noquote() << "Cozytouch discovery started for" << m_config.effectiveEndpoint();
}

void CozytouchSidecar::stopPipeline()
{
    if (m_coordinator)
        m_coordinator->stop();
    if (m_tracker)
        m_tracker->stop();

    m_exporter.reset();
    m_tracker.reset();
    m_coordinator.reset();
    m_registry.reset();
    m_exclusive.reset();
    m_gateway.reset();

    m_fullSyncSent = false;
}

void CozytouchSidecar::reportError(const QString &error)
{
    std::cerr << "cozytouch-ipc " << error.toStdString() << '\n';
    sendError(error.toStdString());
}

void CozytouchSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "cozytouch-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse CozytouchSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    const QJsonObject params = parseObject(request.paramsJson);

    // Without new credentials a suspended pipeline is simply resumed.
    if (params.isEmpty() && m_coordinator
        && m_coordinator->state() == CoordinatorState::Suspended) {
        QString error;
        if (!m_coordinator->reauthenticate(&error)) {
            response.status = CmdStatus::Failure;
            response.error = error.toStdString();
            response.resultType = v1::ActionResultType::None;
            return response;
        }
        m_tracker->resume();
        response.status = CmdStatus::Success;
        response.resultType = v1::ActionResultType::String;
        response.resultValue = std::string("Logged in, discovery resumed");
        return response;
    }

    QJsonObject merged = m_meta;
    for (auto it = params.constBegin(); it != params.constEnd(); ++it)
        merged.insert(it.key(), it.value());
    const CozytouchConfig config = CozytouchConfig::fromJson(merged);

    // Own network manager: the live session cookie stays untouched.
    QNetworkAccessManager network;
    OverkizGateway gateway(&network, config);
    QString error;
    const ApiStatus status = gateway.login(&error);
    if (status != ApiStatus::Ok) {
        response.status = CmdStatus::Failure;
        response.error = error.isEmpty() ? std::string(apiStatusName(status)) : error.toStdString();
        response.resultType = v1::ActionResultType::None;
        return response;
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = QStringLiteral("Logged in to %1").arg(config.effectiveEndpoint()).toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse CozytouchSidecar::invokeRefresh(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    if (!m_coordinator) {
        response.status = CmdStatus::Failure;
        response.error = m_hasBootstrap ? "Cozytouch credentials missing" : "Adapter not bootstrapped";
        return response;
    }
    if (m_coordinator->state() == CoordinatorState::Suspended) {
        response.status = CmdStatus::Failure;
        response.error = "Authentication required, run probe first";
        return response;
    }

    m_coordinator->forceRefresh();
    const CoordinatorStatus status = m_coordinator->status();
    if (status.lastErrorKind != ApiStatus::Ok) {
        response.status = CmdStatus::Failure;
        response.error = status.lastError.toStdString();
        return response;
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = QStringLiteral("Snapshot %1 with %2 entities")
                               .arg(status.sequence)
                               .arg(m_registry->size())
                               .toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse CozytouchSidecar::invokeExportDiagnostics(const sdk::AdapterActionInvokeRequest &request)
{
    ActionResponse response;
    response.id = request.cmdId;
    response.tsMs = nowMs();

    if (!m_exporter) {
        response.status = CmdStatus::Failure;
        response.error = "Adapter not bootstrapped";
        return response;
    }

    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = m_exporter->exportJson(QJsonDocument::Compact).toStdString();
    return response;
}

phicore::adapter::v1::CmdResponse CozytouchSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::cozytouch::ipc
