#include "server_args.h"

namespace pluginconf_server {

namespace {

bool takeValue(const QString& arg, const QString& name, QString& value) {
    const QString prefix = "--" + name + "=";
    if (!arg.startsWith(prefix)) {
        return false;
    }
    value = arg.mid(prefix.size());
    return true;
}

} // namespace

ServerArgs ServerArgs::parse(const QStringList& args) {
    ServerArgs result;

    for (int i = 1; i < args.size(); ++i) {
        const QString& arg = args[i];
        QString value;
        if (arg == "-h" || arg == "--help") {
            result.help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            result.version = true;
            continue;
        }
        if (takeValue(arg, "data-root", value)) {
            result.dataRoot = value;
            if (result.dataRoot.isEmpty()) {
                result.error = "data-root cannot be empty";
                return result;
            }
            continue;
        }
        if (takeValue(arg, "port", value)) {
            bool ok = false;
            result.port = value.toInt(&ok);
            if (!ok || result.port < 1 || result.port > 65535) {
                result.error = "invalid port: " + value;
                return result;
            }
            result.hasPort = true;
            continue;
        }
        if (takeValue(arg, "host", value)) {
            result.host = value;
            if (result.host.isEmpty()) {
                result.error = "host cannot be empty";
                return result;
            }
            result.hasHost = true;
            continue;
        }
        if (takeValue(arg, "log-level", value)) {
            result.logLevel = value;
            if (result.logLevel != "debug" && result.logLevel != "info"
                && result.logLevel != "warn" && result.logLevel != "error") {
                result.error = "invalid log level: " + result.logLevel;
                return result;
            }
            result.hasLogLevel = true;
            continue;
        }

        result.error = "unknown option: " + arg;
        return result;
    }

    return result;
}

} // namespace pluginconf_server
