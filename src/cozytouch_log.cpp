#include "cozytouch_log.h"

Q_LOGGING_CATEGORY(adapterLog, "phi-core.adapters.cozytouch")
Q_LOGGING_CATEGORY(coordinatorLog, "phi-core.adapters.cozytouch.coordinator")
Q_LOGGING_CATEGORY(eventsLog, "phi-core.adapters.cozytouch.events")
Q_LOGGING_CATEGORY(registryLog, "phi-core.adapters.cozytouch.registry")
Q_LOGGING_CATEGORY(gatewayLog, "phi-core.adapters.cozytouch.gateway")
Q_LOGGING_CATEGORY(diagnosticsLog, "phi-core.adapters.cozytouch.diagnostics")
