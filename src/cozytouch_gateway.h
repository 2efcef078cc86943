#pragma once

#include <cstdint>

#include <QByteArray>
#include <QString>

#include "cozytouch_model.h"

namespace phicore::cozytouch {

// Boundary to the remote home-automation API. Calls may block; an
// implementation must bound them with a timeout and report the timeout as
// ApiStatus::TransportError. AuthError is reserved for invalid credentials
// or a session that could not be re-established.
class ApiGateway
{
public:
    virtual ~ApiGateway() = default;

    virtual ApiStatus login(QString *error = nullptr) = 0;

    // Raw setup payload (device records) of the current session.
    virtual ApiStatus listDevices(QByteArray *payload, QString *error = nullptr) = 0;

    // Raw JSON array of remote events newer than sinceMs.
    virtual ApiStatus fetchEvents(std::int64_t sinceMs, QByteArray *payload, QString *error = nullptr) = 0;
};

// Admits one call at a time into the wrapped gateway. A call issued while
// another one is still blocked (from a nested event loop) fails with
// TransportError without reaching the inner gateway.
class ExclusiveGateway final : public ApiGateway
{
public:
    explicit ExclusiveGateway(ApiGateway *inner);

    ApiStatus login(QString *error = nullptr) override;
    ApiStatus listDevices(QByteArray *payload, QString *error = nullptr) override;
    ApiStatus fetchEvents(std::int64_t sinceMs, QByteArray *payload, QString *error = nullptr) override;

    bool isBusy() const { return m_inCall; }
    int rejectedCalls() const { return m_rejected; }

private:
    bool enter(const char *call, QString *error);

    ApiGateway *m_inner = nullptr;
    bool m_inCall = false;
    int m_rejected = 0;
};

} // namespace phicore::cozytouch
