#pragma once

#include <QList>
#include <QString>

#include "cozytouch_model.h"
#include "cozytouch_registry.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::cozytouch::ipc {

struct DeviceEntry {
    phicore::adapter::v1::Device device;
    phicore::adapter::v1::ChannelList channels;
};

// Registry entries of one device as a phi device with one read-only channel
// per discovered state. device may be null when the device vanished from the
// latest snapshot.
DeviceEntry buildDeviceEntry(const QString &deviceId,
                             const Device *device,
                             const QList<RegistryEntry> &entries);

phicore::adapter::v1::Channel makeStateChannel(const RegistryEntry &entry);
phicore::adapter::v1::ScalarValue toScalarValue(const RegistryEntry &entry, const StateValue &value);

} // namespace phicore::cozytouch::ipc
