#pragma once

#include <QString>

namespace pluginconf_server {

/// Process-wide spdlog setup. Qt log macros are forwarded to the default
/// spdlog logger once init() succeeds.
class ServerLogger {
public:
    struct Config {
        QString logLevel = "info";
        QString logDir;
        QString fileName = "pluginconf.log";
        qint64 maxFileBytes = 10 * 1024 * 1024;
        int maxFiles = 3;
    };

    static bool init(const Config& config, QString& error);
    static void shutdown();

private:
    ServerLogger() = delete;
};

} // namespace pluginconf_server
