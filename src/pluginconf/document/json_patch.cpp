#include "json_patch.h"

#include <QJsonArray>
#include <QStringList>

namespace pluginconf {

namespace {

QStringList splitPath(const QString& subPath) {
    return subPath.split('/', Qt::SkipEmptyParts);
}

QString pathPrefix(const QStringList& segments, int count) {
    return "/" + segments.mid(0, count).join('/');
}

QJsonValue assignValue(const QJsonValue& current, const QJsonValue& value) {
    if (current.isObject() && value.isObject()) {
        QJsonObject target = current.toObject();
        const QJsonObject overlay = value.toObject();
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            target[it.key()] = it.value();
        }
        return target;
    }
    return value;
}

bool setAt(QJsonValue& node,
           const QStringList& segments,
           int index,
           const QJsonValue& value,
           QString& error) {
    const QString& segment = segments[index];
    const bool last = index == segments.size() - 1;

    if (node.isObject()) {
        QJsonObject obj = node.toObject();
        if (last) {
            obj[segment] = assignValue(obj.value(segment), value);
            node = obj;
            return true;
        }

        if (!obj.contains(segment)) {
            error = "invalid sub-path: " + pathPrefix(segments, index + 1);
            return false;
        }
        QJsonValue child = obj.value(segment);
        if (!setAt(child, segments, index + 1, value, error)) {
            return false;
        }
        obj[segment] = child;
        node = obj;
        return true;
    }

    if (node.isArray()) {
        QJsonArray arr = node.toArray();
        bool ok = false;
        const int pos = segment.toInt(&ok);
        if (!ok || pos < 0 || pos >= arr.size()) {
            error = "invalid sub-path: " + pathPrefix(segments, index + 1);
            return false;
        }
        if (last) {
            arr[pos] = assignValue(arr.at(pos), value);
            node = arr;
            return true;
        }
        QJsonValue child = arr.at(pos);
        if (!setAt(child, segments, index + 1, value, error)) {
            return false;
        }
        arr[pos] = child;
        node = arr;
        return true;
    }

    // scalar (or null) where a container was expected
    error = "invalid sub-path: " + pathPrefix(segments, index);
    return false;
}

} // namespace

QJsonObject JsonPatch::merge(const QJsonObject& base, const QJsonObject& patch) {
    QJsonObject result = base;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (it.value().isObject() && result.contains(it.key())
            && result.value(it.key()).isObject()) {
            result[it.key()] = merge(result.value(it.key()).toObject(), it.value().toObject());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

bool JsonPatch::patch(QJsonObject& doc,
                      const QString& subPath,
                      const QJsonValue& value,
                      QString& error) {
    const QStringList segments = splitPath(subPath);
    if (segments.isEmpty()) {
        if (!value.isObject()) {
            error = "invalid sub-path: /";
            return false;
        }
        doc = value.toObject();
        error.clear();
        return true;
    }

    QJsonValue root = doc;
    if (!setAt(root, segments, 0, value, error)) {
        return false;
    }
    doc = root.toObject();
    error.clear();
    return true;
}

} // namespace pluginconf
