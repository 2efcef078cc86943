#pragma once

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "cozytouch_config.h"

namespace phicore::cozytouch {

class DiscoveryCoordinator;
class EventTracker;
class EntityRegistry;

// Builds the on-demand diagnostics document from the committed snapshot, the
// event buffer and the registry. Read-only; any source may be null.
class DiagnosticsExporter
{
public:
    DiagnosticsExporter(const DiscoveryCoordinator *coordinator,
                        const EventTracker *tracker,
                        const EntityRegistry *registry);

    void setConfig(const CozytouchConfig &config);

    QJsonObject exportDocument() const;
    QByteArray exportJson(QJsonDocument::JsonFormat format = QJsonDocument::Indented) const;

private:
    const DiscoveryCoordinator *m_coordinator = nullptr;
    const EventTracker *m_tracker = nullptr;
    const EntityRegistry *m_registry = nullptr;
    CozytouchConfig m_config;
    bool m_hasConfig = false;
};

} // namespace phicore::cozytouch
