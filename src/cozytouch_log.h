#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(adapterLog)
Q_DECLARE_LOGGING_CATEGORY(coordinatorLog)
Q_DECLARE_LOGGING_CATEGORY(eventsLog)
Q_DECLARE_LOGGING_CATEGORY(registryLog)
Q_DECLARE_LOGGING_CATEGORY(gatewayLog)
Q_DECLARE_LOGGING_CATEGORY(diagnosticsLog)
