#include "admin_utils.h"

#include <QDateTime>
#include <QJsonArray>

namespace pluginconf {

qint64 systemClockSeconds() {
    return QDateTime::currentSecsSinceEpoch();
}

void injectTimestamps(QJsonObject& conf, const QJsonObject& previous, const Clock& clock) {
    const qint64 now = clock ? clock() : systemClockSeconds();
    if (previous.value("create_time").isDouble()) {
        conf["create_time"] = previous.value("create_time");
    } else {
        conf["create_time"] = now;
    }
    conf["update_time"] = now;
}

void fixCount(QJsonObject& body, const QString& id) {
    const QJsonObject node = body.value("node").toObject();
    if (node.value("dir").toBool()) {
        body["count"] = node.value("nodes").toArray().size();
        return;
    }
    if (!id.isEmpty() && body.contains("count")) {
        body["count"] = 1;
    }
}

} // namespace pluginconf
