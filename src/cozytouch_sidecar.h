#pragma once

#include <cstdint>
#include <memory>

#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>

#include "cozytouch_config.h"
#include "cozytouch_coordinator.h"
#include "cozytouch_diagnostics.h"
#include "cozytouch_events.h"
#include "cozytouch_overkiz.h"
#include "cozytouch_registry.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::cozytouch::ipc {

class CozytouchSidecar final : public phicore::adapter::sdk::AdapterSidecar, public DiscoveryObserver
{
public:
    CozytouchSidecar();
    ~CozytouchSidecar() override;

    bool applyBatch(const DiscoveryBatch &batch, QString *error = nullptr) override;

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    static std::int64_t nowMs();

    void applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter);
    void startPipeline();
    void stopPipeline();
    void reportError(const QString &error);
    void setConnectionState(bool connected);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeRefresh(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeExportDiagnostics(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;

    QNetworkAccessManager m_network;
    CozytouchConfig m_config;
    QJsonObject m_meta;

    std::unique_ptr<OverkizGateway> m_gateway;
    std::unique_ptr<ExclusiveGateway> m_exclusive;
    std::unique_ptr<EntityRegistry> m_registry;
    std::unique_ptr<DiscoveryCoordinator> m_coordinator;
    std::unique_ptr<EventTracker> m_tracker;
    std::unique_ptr<DiagnosticsExporter> m_exporter;

    bool m_connected = false;
    bool m_hasBootstrap = false;
    bool m_fullSyncSent = false;
};

} // namespace phicore::cozytouch::ipc
