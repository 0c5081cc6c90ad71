#include <QCoreApplication>
#include <QDir>
#include <QHostAddress>
#include <QHttpServer>
#include <QTcpServer>
#include <QTextStream>

#include <csignal>
#include <cstdio>

#include "config/server_args.h"
#include "config/server_config.h"
#include "http/admin_router.h"
#include "server_manager.h"
#include "utils/server_logger.h"

using namespace pluginconf_server;

namespace {

void printHelp() {
    QTextStream err(stderr);
    err << "Usage: pluginconf_server [options]\n"
        << "Options:\n"
        << "  --data-root=<path>       Data root directory (default: .)\n"
        << "  --port=<port>            HTTP port (default: 9180)\n"
        << "  --host=<addr>            Listen address (default: 127.0.0.1)\n"
        << "  --log-level=<level>      debug|info|warn|error (default: info)\n"
        << "  -h, --help               Show this help\n"
        << "  -v, --version            Show version\n";
    err.flush();
}

bool ensureDirectories(const QString& dataRoot) {
    static const char* kDirs[] = {"store", "plugins", "logs"};
    for (const char* sub : kDirs) {
        if (!QDir(dataRoot + "/" + sub).mkpath(".")) {
            std::fprintf(stderr, "Error: failed to create %s/%s\n", qUtf8Printable(dataRoot), sub);
            return false;
        }
    }
    return true;
}

void requestQuitSignalHandler(int) {
    QMetaObject::invokeMethod(
        qApp,
        []() { QCoreApplication::quit(); },
        Qt::QueuedConnection);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    const ServerArgs args = ServerArgs::parse(app.arguments());
    if (args.help) {
        printHelp();
        return 0;
    }
    if (args.version) {
        std::fprintf(stderr, "pluginconf_server 0.1.0\n");
        return 0;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        return 2;
    }

    const QString dataRoot = QDir(args.dataRoot).absolutePath();

    QString cfgErr;
    ServerConfig config = ServerConfig::loadFromFile(dataRoot + "/config.json", cfgErr);
    if (!cfgErr.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(cfgErr));
        return 2;
    }
    config.applyArgs(args);

    if (!ensureDirectories(dataRoot)) {
        return 1;
    }

    ServerLogger::Config logConfig;
    logConfig.logLevel = config.logLevel;
    logConfig.logDir = dataRoot + "/logs";
    logConfig.maxFileBytes = config.logMaxBytes;
    logConfig.maxFiles = config.logMaxFiles;
    QString logErr;
    if (!ServerLogger::init(logConfig, logErr)) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(logErr));
        return 1;
    }

    ServerManager manager(dataRoot, config);
    QString initErr;
    if (!manager.initialize(initErr)) {
        qCritical("Init error: %s", qUtf8Printable(initErr));
        ServerLogger::shutdown();
        return 1;
    }
    manager.startRouteRefresh();

    QHttpServer httpServer;
    QTcpServer tcpServer;
    AdminRouter router(manager.controller());
    router.registerRoutes(httpServer);

    if (!tcpServer.listen(QHostAddress(config.host), static_cast<quint16>(config.port))) {
        qCritical("failed to listen on %s:%d", qUtf8Printable(config.host), config.port);
        ServerLogger::shutdown();
        return 1;
    }
    if (!httpServer.bind(&tcpServer)) {
        qCritical("failed to bind HTTP server");
        ServerLogger::shutdown();
        return 1;
    }

    qInfo("Admin API (%s) listening on %s:%d", qUtf8Printable(config.adminApiVersion),
          qUtf8Printable(config.host), static_cast<int>(tcpServer.serverPort()));

    std::signal(SIGINT, requestQuitSignalHandler);
#ifdef SIGTERM
    std::signal(SIGTERM, requestQuitSignalHandler);
#endif

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        manager.shutdown();
    });

    const int rc = app.exec();
    ServerLogger::shutdown();
    return rc;
}
