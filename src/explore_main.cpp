#include <cstdlib>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QNetworkAccessManager>
#include <QSaveFile>

#include "cozytouch_config.h"
#include "cozytouch_coordinator.h"
#include "cozytouch_diagnostics.h"
#include "cozytouch_events.h"
#include "cozytouch_overkiz.h"
#include "cozytouch_registry.h"

namespace {

using namespace phicore::cozytouch;

void printDevice(const Device &device)
{
    std::cout << "\nDevice: " << device.label.toStdString() << '\n'
              << "  URL: " << device.id.toStdString() << '\n'
              << "  Widget: " << device.widget.toStdString() << '\n'
              << "  UI Class: " << device.uiClass.toStdString() << '\n'
              << "  Controllable Name: " << device.typeLabel.toStdString() << '\n'
              << "  Protocol: " << device.protocol.toStdString() << '\n'
              << "  Available: " << (device.available ? "true" : "false") << '\n';
    if (!device.parseError.isEmpty())
        std::cout << "  Parse error: " << device.parseError.toStdString() << '\n';

    std::cout << "  States (" << device.states.size() << "):\n";
    for (const StateEntry &state : device.states) {
        std::cout << "    " << state.name.toStdString() << ": " << stateValueToString(state.value).toStdString()
                  << " (" << stateValueTypeName(state.value);
        if (!state.unitHint.isEmpty())
            std::cout << ", " << state.unitHint.toStdString();
        std::cout << ")\n";
    }

    std::cout << "  Attributes (" << device.attributes.size() << "):\n";
    for (auto it = device.attributes.constBegin(); it != device.attributes.constEnd(); ++it)
        std::cout << "    " << it.key().toStdString() << ": " << stateValueToString(it.value()).toStdString() << '\n';

    std::cout << "  Commands (" << device.commands.size() << "):\n";
    for (const QString &command : device.commands)
        std::cout << "    " << command.toStdString() << '\n';
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("cozytouch_explore"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Explore the data exposed by a Cozytouch account"));
    parser.addHelpOption();

    const QCommandLineOption emailOption({QStringLiteral("e"), QStringLiteral("email")},
                                         QStringLiteral("Cozytouch account e-mail."),
                                         QStringLiteral("email"));
    const QCommandLineOption passwordOption({QStringLiteral("p"), QStringLiteral("password")},
                                            QStringLiteral("Cozytouch account password (or COZYTOUCH_PASSWORD)."),
                                            QStringLiteral("password"));
    const QCommandLineOption serverOption({QStringLiteral("s"), QStringLiteral("server")},
                                          QStringLiteral("Server to connect to."),
                                          QStringLiteral("server"),
                                          QString::fromLatin1(kDefaultServer));
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Output file (default: cozytouch_api_dump_<timestamp>.json)."),
                                          QStringLiteral("file"));
    const QCommandLineOption listServersOption(QStringLiteral("list-servers"),
                                               QStringLiteral("List available servers and exit."));
    parser.addOption(emailOption);
    parser.addOption(passwordOption);
    parser.addOption(serverOption);
    parser.addOption(outputOption);
    parser.addOption(listServersOption);
    parser.process(app);

    if (parser.isSet(listServersOption)) {
        std::cout << "Available servers:\n";
        for (const ServerInfo &server : supportedServers())
            std::cout << "  - " << server.key.toStdString() << " (" << server.name.toStdString() << ")\n";
        return 0;
    }

    QString password = parser.value(passwordOption);
    if (password.isEmpty())
        password = qEnvironmentVariable("COZYTOUCH_PASSWORD");
    if (!parser.isSet(emailOption) || password.isEmpty()) {
        std::cerr << "error: --email and --password are required\n";
        return 2;
    }

    QJsonObject settings;
    settings.insert(QStringLiteral("username"), parser.value(emailOption));
    settings.insert(QStringLiteral("password"), password);
    settings.insert(QStringLiteral("server"), parser.value(serverOption));
    const CozytouchConfig config = CozytouchConfig::fromJson(settings);

    if (!findServer(config.server, nullptr)) {
        std::cerr << "error: unknown server '" << config.server.toStdString() << "'\n";
        return 2;
    }

    std::cout << "Server: " << config.server.toStdString() << '\n'
              << "Time: " << QDateTime::currentDateTime().toString(Qt::ISODate).toStdString() << '\n';

    QNetworkAccessManager network;
    OverkizGateway gateway(&network, config);

    std::cout << "Logging in...\n";
    QString error;
    if (gateway.login(&error) != ApiStatus::Ok) {
        std::cerr << "error: login failed: " << error.toStdString() << '\n';
        return 1;
    }

    EntityRegistry registry;
    DiscoveryCoordinator coordinator(&gateway);
    coordinator.setBackoffPolicy(config.pollBackoff());
    coordinator.addObserver(&registry);
    coordinator.start(false);

    std::cout << "Fetching setup data...\n";
    coordinator.forceRefresh();
    const CoordinatorStatus status = coordinator.status();
    coordinator.stop();
    if (status.lastErrorKind != ApiStatus::Ok) {
        std::cerr << "error: fetching setup failed: " << status.lastError.toStdString() << '\n';
        return 1;
    }

    EventTracker tracker(&gateway, config.eventBufferCapacity);
    std::cout << "Fetching events...\n";
    if (tracker.pollOnce(nullptr, &error) != ApiStatus::Ok)
        std::cerr << "warning: fetching events failed: " << error.toStdString() << '\n';

    const SnapshotPtr snapshot = coordinator.currentSnapshot();
    if (snapshot) {
        std::cout << "  Found " << snapshot->gateways.size() << " gateway(s)\n"
                  << "  Found " << snapshot->devices.size() << " device(s)\n";
        for (const Device &device : snapshot->devices)
            printDevice(device);
    }

    DiagnosticsExporter exporter(&coordinator, &tracker, &registry);
    exporter.setConfig(config);

    QString outputPath = parser.value(outputOption);
    if (outputPath.isEmpty()) {
        outputPath = QStringLiteral("cozytouch_api_dump_%1.json")
                         .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss")));
    }

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly) || file.write(exporter.exportJson()) < 0 || !file.commit()) {
        std::cerr << "error: cannot write " << outputPath.toStdString() << ": " << file.errorString().toStdString() << '\n';
        return 1;
    }

    std::cout << "\nReport saved to: " << outputPath.toStdString() << '\n'
              << "Summary:\n"
              << "  Gateways: " << (snapshot ? snapshot->gateways.size() : 0) << '\n'
              << "  Devices: " << (snapshot ? snapshot->devices.size() : 0) << '\n'
              << "  Discovered fields: " << registry.size() << '\n'
              << "  Events: " << tracker.size() << '\n';
    return EXIT_SUCCESS;
}
