#include "cozytouch_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "cozytouch_config.h"

namespace phicore::cozytouch::ipc {

namespace {

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray serverOptions()
{
    QJsonArray options;
    for (const ServerInfo &server : supportedServers()) {
        QJsonObject option;
        option.insert(QStringLiteral("value"), server.key);
        option.insert(QStringLiteral("label"), server.name);
        options.append(option);
    }
    return options;
}

QJsonArray accountFields()
{
    QJsonArray fields;

    const QJsonArray required{QStringLiteral("Required")};
    fields.append(field(QStringLiteral("username"),
                        QStringLiteral("String"),
                        QStringLiteral("E-mail"),
                        QStringLiteral("Cozytouch account e-mail address."),
                        QJsonValue(),
                        required));

    const QJsonArray secret{QStringLiteral("Required"), QStringLiteral("Secret")};
    fields.append(field(QStringLiteral("password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Cozytouch account password."),
                        QJsonValue(),
                        secret));

    QJsonObject server = field(QStringLiteral("server"),
                               QStringLiteral("Select"),
                               QStringLiteral("Server"),
                               QStringLiteral("Overkiz cloud the account belongs to."),
                               QJsonValue(QString::fromLatin1(kDefaultServer)));
    server.insert(QStringLiteral("options"), serverOptions());
    fields.append(server);

    return fields;
}

QJsonArray pollingFields()
{
    QJsonArray fields;
    fields.append(field(QStringLiteral("pollIntervalSec"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Seconds between two reads of the account setup (5-3600)."),
                        QJsonValue(30)));
    fields.append(field(QStringLiteral("eventPollIntervalSec"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Event interval"),
                        QStringLiteral("Seconds between two event fetches (2-3600)."),
                        QJsonValue(10)));
    fields.append(field(QStringLiteral("maxBackoffSec"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Maximum retry delay"),
                        QStringLiteral("Upper bound of the retry delay after failures."),
                        QJsonValue(900)));
    fields.append(field(QStringLiteral("refreshOnEvents"),
                        QStringLiteral("Boolean"),
                        QStringLiteral("Refresh on events"),
                        QStringLiteral("Read the setup again when the cloud reports a device change."),
                        QJsonValue(true)));
    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Atlantic Cozytouch";
}

phicore::adapter::v1::Utf8String description()
{
    return "Read-only discovery of Atlantic Cozytouch heat pumps and water heaters";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Cozytouch\">"
        "<path d=\"M12 3 3 10.5V21h6v-6h6v6h6V10.5z\" fill=\"none\" stroke=\"#E30613\" stroke-width=\"1.8\" stroke-linejoin=\"round\"/>"
        "<path d=\"M12 9.2c1.4 1.5 2.2 2.7 2.2 3.8a2.2 2.2 0 0 1-4.4 0c0-1.1.8-2.3 2.2-3.8z\" fill=\"#0069B4\"/>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.required = v1::AdapterRequirement::ManualConfirm
        | v1::AdapterRequirement::UsesRetryInterval;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::RequiresPolling;

    v1::AdapterActionDescriptor probe;
    probe.id = "probe";
    probe.label = "Test login";
    probe.description = "Log in to the Cozytouch cloud with the given account";
    probe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    caps.factoryActions.push_back(probe);
    caps.instanceActions.push_back(probe);

    v1::AdapterActionDescriptor refresh;
    refresh.id = "refresh";
    refresh.label = "Refresh now";
    refresh.description = "Read the account setup immediately.";
    refresh.metaJson = R"({"placement":"card","kind":"command"})";
    caps.instanceActions.push_back(refresh);

    v1::AdapterActionDescriptor diagnostics;
    diagnostics.id = "exportDiagnostics";
    diagnostics.label = "Export diagnostics";
    diagnostics.description = "Snapshot, recent events and discovered fields as JSON (credentials redacted).";
    diagnostics.metaJson = R"({"placement":"card","kind":"command","resultFormat":"json"})";
    caps.instanceActions.push_back(diagnostics);

    caps.defaultsJson = R"({"server":"atlantic_cozytouch","pollIntervalSec":30,"eventPollIntervalSec":10,"maxBackoffSec":900,"refreshOnEvents":true})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    QJsonArray fields = accountFields();
    for (const QJsonValue &entry : pollingFields())
        fields.append(entry);

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Atlantic Cozytouch"),
                          QStringLiteral("Connect a Cozytouch account."),
                          accountFields()));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Atlantic Cozytouch"),
                          QStringLiteral("Cozytouch account and polling settings."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::cozytouch::ipc
