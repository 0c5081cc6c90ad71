#include "json_value.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <cmath>

namespace pluginconf {

bool jsonToInteger(const QJsonValue& value, qint64 min, qint64 max, qint64& out) {
    if (!value.isDouble()) {
        return false;
    }
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return false;
    }
    if (d < static_cast<double>(min) || d > static_cast<double>(max)) {
        return false;
    }
    out = static_cast<qint64>(d);
    return true;
}

QString jsonScalarToString(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        qint64 n = 0;
        if (jsonToInteger(value, -kMaxSafeInteger, kMaxSafeInteger, n)) {
            return QString::number(n);
        }
        return QString::number(value.toDouble());
    }
    return QString();
}

QString encodeJsonValue(const QJsonValue& value) {
    // QJsonDocument only serializes containers, so wrap and strip the brackets
    const QByteArray wrapped = QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
    return QString::fromUtf8(wrapped.mid(1, wrapped.size() - 2));
}

} // namespace pluginconf
