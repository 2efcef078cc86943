#pragma once

#include <cstdint>

#include <QByteArray>
#include <QJsonValue>
#include <QString>

#include "cozytouch_model.h"

namespace phicore::cozytouch {

// Turns the raw Overkiz setup payload of one poll into a Snapshot. Accepts
// either the device array of /setup/devices or the /setup object. Individual
// broken records never fail the build; they end up as devices with an empty
// state list and a parseError.
class SnapshotBuilder
{
public:
    SnapshotBuilder() = default;

    bool build(const QByteArray &payload,
               std::int64_t timestampMs,
               Snapshot *out,
               QString *error = nullptr);

    bool build(const QJsonValue &root,
               std::int64_t timestampMs,
               Snapshot *out,
               QString *error = nullptr);

    std::uint64_t lastSequence() const { return m_sequence; }

private:
    std::uint64_t m_sequence = 0;
};

bool parseDeviceRecord(const QJsonValue &record, int index, Device *out, QString *error = nullptr);

} // namespace phicore::cozytouch
