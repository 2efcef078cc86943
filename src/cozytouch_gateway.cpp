#include "cozytouch_gateway.h"

#include "cozytouch_log.h"

namespace phicore::cozytouch {

namespace {

class CallScope
{
public:
    explicit CallScope(bool *flag) : m_flag(flag) { *m_flag = true; }
    ~CallScope() { *m_flag = false; }

    CallScope(const CallScope &) = delete;
    CallScope &operator=(const CallScope &) = delete;

private:
    bool *m_flag;
};

} // namespace

ExclusiveGateway::ExclusiveGateway(ApiGateway *inner)
    : m_inner(inner)
{
}

bool ExclusiveGateway::enter(const char *call, QString *error)
{
    if (!m_inner) {
        if (error)
            *error = QStringLiteral("No Cozytouch gateway");
        return false;
    }
    if (!m_inCall)
        return true;

    ++m_rejected;
    qCDebug(gatewayLog) << "Rejecting nested" << call << "while another call is in flight";
    if (error)
        *error = QStringLiteral("Cozytouch gateway busy");
    return false;
}

ApiStatus ExclusiveGateway::login(QString *error)
{
    if (!enter("login", error))
        return ApiStatus::TransportError;
    CallScope scope(&m_inCall);
    return m_inner->login(error);
}

ApiStatus ExclusiveGateway::listDevices(QByteArray *payload, QString *error)
{
    if (!enter("listDevices", error))
        return ApiStatus::TransportError;
    CallScope scope(&m_inCall);
    return m_inner->listDevices(payload, error);
}

ApiStatus ExclusiveGateway::fetchEvents(std::int64_t sinceMs, QByteArray *payload, QString *error)
{
    if (!enter("fetchEvents", error))
        return ApiStatus::TransportError;
    CallScope scope(&m_inCall);
    return m_inner->fetchEvents(sinceMs, payload, error);
}

} // namespace phicore::cozytouch
