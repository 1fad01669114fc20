// Entry point: reads configuration, checks the credential and opens the main
// window. A missing or rejected credential ends the process before any tree
// state is built.
#include "MainWindow.hpp"
#include "UiAlerts.hpp"
#include "openzone/CloudflareGateway.hpp"
#include "openzone/MockZoneGateway.hpp"
#include "openzone/RuntimeEnv.hpp"

#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QSettings>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace {

constexpr int kMinTimeoutMs = 1000;
constexpr int kMaxTimeoutMs = 300000;

openzone::GatewayOptions gatewayOptionsFromSettings(const QSettings &s) {
    openzone::GatewayOptions opt;
    opt.base_url = s.value("Gateway/baseUrl",
                           QString::fromStdString(opt.base_url))
                       .toString()
                       .trimmed()
                       .toStdString();
    if (auto envBase = openzone::trimmedEnv(openzone::kApiBaseEnv))
        opt.base_url = *envBase;
    int timeout = s.value("Gateway/timeoutMs", opt.timeout_ms).toInt();
    if (timeout < kMinTimeoutMs)
        timeout = kMinTimeoutMs;
    if (timeout > kMaxTimeoutMs)
        timeout = kMaxTimeoutMs;
    opt.timeout_ms = timeout;
    return opt;
}

} // namespace

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("OpenZone");
    QCoreApplication::setApplicationName("OpenZone");
    QCoreApplication::setApplicationVersion("0.3.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Browse and edit DNS zones and records.");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption mockOpt(
        "mock", "Use the built-in in-memory zones instead of Cloudflare.");
    parser.addOption(mockOpt);
    parser.process(app);

    std::unique_ptr<openzone::ZoneGateway> gateway;
    QString backendName;
    if (parser.isSet(mockOpt)) {
        gateway = std::make_unique<openzone::MockZoneGateway>();
        backendName = "mock";
    } else {
        const auto token = openzone::trimmedEnv(openzone::kTokenEnv);
        if (!token) {
            std::fprintf(stderr, "[OpenZone] %s is not set; export an API "
                                 "token or run with --mock\n",
                         openzone::kTokenEnv);
            return EXIT_FAILURE;
        }

        QSettings s("OpenZone", "OpenZone");
        openzone::GatewayOptions opt = gatewayOptionsFromSettings(s);
        opt.token = *token;
        auto cf = std::make_unique<openzone::CloudflareGateway>(opt);

        // Only a rejected credential is fatal here; network trouble is left
        // for the tree to report.
        const auto verified = cf->verifyCredential();
        if (!verified &&
            verified.error().kind == openzone::GatewayError::Kind::Auth) {
            const std::string why = verified.error().describe();
            std::fprintf(stderr, "[OpenZone] API token rejected: %s\n",
                         why.c_str());
            UiAlerts::critical(nullptr, QObject::tr("OpenZone"),
                               QObject::tr("The API token was rejected:\n%1")
                                   .arg(QString::fromStdString(why)));
            return EXIT_FAILURE;
        }
        if (!verified) {
            std::fprintf(stderr,
                         "[OpenZone] could not verify API token: %s\n",
                         verified.error().describe().c_str());
        }
        gateway = std::move(cf);
        backendName = "Cloudflare";
    }

    MainWindow w(std::move(gateway), backendName);
    w.show();
    return app.exec();
}
