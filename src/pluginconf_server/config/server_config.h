#pragma once

#include <QString>

#include "server_args.h"

namespace pluginconf_server {

struct ServerConfig {
    int port = 9180;
    QString host = "127.0.0.1";
    QString logLevel = "info";
    QString adminApiVersion = "v3";
    int routeRefreshIntervalMs = 1000;
    qint64 logMaxBytes = 10 * 1024 * 1024;  // 10MB
    int logMaxFiles = 3;

    static ServerConfig loadFromFile(const QString& filePath, QString& error);
    void applyArgs(const ServerArgs& args);
};

} // namespace pluginconf_server
