#include "server_config.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

namespace pluginconf_server {

namespace {

constexpr int kMinRouteRefreshMs = 100;
constexpr qint64 kMinLogBytes = 1024;
constexpr int kMaxLogFiles = 100;

bool isValidLogLevel(const QString& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool isInteger(const QJsonValue& value) {
    return value.isDouble() && value.toDouble() == static_cast<double>(value.toInteger());
}

} // namespace

ServerConfig ServerConfig::loadFromFile(const QString& filePath, QString& error) {
    ServerConfig cfg;

    if (!QFileInfo::exists(filePath)) {
        error.clear();
        return cfg;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open config file: " + filePath;
        return cfg;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "config.json parse error: " + parseErr.errorString();
        return cfg;
    }
    if (!doc.isObject()) {
        error = "config.json must contain a JSON object";
        return cfg;
    }

    const QJsonObject obj = doc.object();
    static const QSet<QString> known = {"port",
                                        "host",
                                        "logLevel",
                                        "adminApiVersion",
                                        "routeRefreshIntervalMs",
                                        "logMaxBytes",
                                        "logMaxFiles"};
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in config.json: " + it.key();
            return cfg;
        }
    }

    if (obj.contains("port")) {
        if (!isInteger(obj.value("port"))) {
            error = "config field 'port' must be an integer";
            return cfg;
        }
        cfg.port = obj.value("port").toInt();
        if (cfg.port < 1 || cfg.port > 65535) {
            error = "config field 'port' out of range";
            return cfg;
        }
    }

    if (obj.contains("host")) {
        if (!obj.value("host").isString()) {
            error = "config field 'host' must be a string";
            return cfg;
        }
        cfg.host = obj.value("host").toString();
        if (cfg.host.isEmpty()) {
            error = "config field 'host' cannot be empty";
            return cfg;
        }
    }

    if (obj.contains("logLevel")) {
        if (!obj.value("logLevel").isString()) {
            error = "config field 'logLevel' must be a string";
            return cfg;
        }
        cfg.logLevel = obj.value("logLevel").toString();
        if (!isValidLogLevel(cfg.logLevel)) {
            error = "invalid config logLevel: " + cfg.logLevel;
            return cfg;
        }
    }

    if (obj.contains("adminApiVersion")) {
        cfg.adminApiVersion = obj.value("adminApiVersion").toString();
        if (cfg.adminApiVersion != "v2" && cfg.adminApiVersion != "v3") {
            error = "config field 'adminApiVersion' must be \"v2\" or \"v3\"";
            return cfg;
        }
    }

    if (obj.contains("routeRefreshIntervalMs")) {
        if (!isInteger(obj.value("routeRefreshIntervalMs"))) {
            error = "config field 'routeRefreshIntervalMs' must be an integer";
            return cfg;
        }
        cfg.routeRefreshIntervalMs = obj.value("routeRefreshIntervalMs").toInt();
        if (cfg.routeRefreshIntervalMs < kMinRouteRefreshMs) {
            error = QString("config field 'routeRefreshIntervalMs' must be >= %1")
                        .arg(kMinRouteRefreshMs);
            return cfg;
        }
    }

    if (obj.contains("logMaxBytes")) {
        if (!isInteger(obj.value("logMaxBytes"))) {
            error = "config field 'logMaxBytes' must be an integer";
            return cfg;
        }
        if (obj.value("logMaxBytes").toInteger() < kMinLogBytes) {
            error = QString("config field 'logMaxBytes' must be >= %1").arg(kMinLogBytes);
            return cfg;
        }
        cfg.logMaxBytes = obj.value("logMaxBytes").toInteger();
    }

    if (obj.contains("logMaxFiles")) {
        if (!isInteger(obj.value("logMaxFiles"))) {
            error = "config field 'logMaxFiles' must be an integer";
            return cfg;
        }
        if (obj.value("logMaxFiles").toInt() < 1 || obj.value("logMaxFiles").toInt() > kMaxLogFiles) {
            error = QString("config field 'logMaxFiles' must be between 1 and %1").arg(kMaxLogFiles);
            return cfg;
        }
        cfg.logMaxFiles = obj.value("logMaxFiles").toInt();
    }

    error.clear();
    return cfg;
}

void ServerConfig::applyArgs(const ServerArgs& args) {
    if (args.hasPort) {
        port = args.port;
    }
    if (args.hasHost) {
        host = args.host;
    }
    if (args.hasLogLevel) {
        logLevel = args.logLevel;
    }
}

} // namespace pluginconf_server
