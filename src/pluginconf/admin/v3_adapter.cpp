#include "v3_adapter.h"

#include <QJsonArray>
#include <QUrlQuery>

namespace pluginconf {

namespace {

bool parsePositiveInt(const QString& text, int& out) {
    bool ok = false;
    const int v = text.toInt(&ok);
    if (!ok || v < 1) {
        return false;
    }
    out = v;
    return true;
}

} // namespace

bool V3Adapter::parseQuery(const QUrlQuery& query, Options& options, QString& error) {
    if (query.hasQueryItem("page")) {
        if (!parsePositiveInt(query.queryItemValue("page"), options.page)) {
            error = "page must be a positive integer";
            return false;
        }
    }
    if (query.hasQueryItem("page_size")) {
        int size = 0;
        if (!parsePositiveInt(query.queryItemValue("page_size"), size)
            || size < kMinPageSize || size > kMaxPageSize) {
            error = QString("page_size must be between %1 and %2")
                        .arg(kMinPageSize)
                        .arg(kMaxPageSize);
            return false;
        }
        options.pageSize = size;
    }
    if (options.page > 0 && options.pageSize == 0) {
        options.pageSize = kMinPageSize;
    }
    options.name = query.queryItemValue("name", QUrl::FullyDecoded);
    options.label = query.queryItemValue("label", QUrl::FullyDecoded);
    error.clear();
    return true;
}

QJsonObject V3Adapter::flattenNode(const QJsonObject& node) {
    QJsonObject out;
    out["key"] = node.value("key");
    out["value"] = node.value("value");
    out["createdIndex"] = node.value("createdIndex");
    out["modifiedIndex"] = node.value("modifiedIndex");
    return out;
}

bool V3Adapter::matches(const QJsonObject& value, const Options& options) {
    if (!options.name.isEmpty()
        && !value.value("name").toString().contains(options.name)) {
        return false;
    }
    if (!options.label.isEmpty()) {
        const QJsonObject labels = value.value("labels").toObject();
        const int sep = options.label.indexOf(':');
        if (sep < 0) {
            return labels.contains(options.label);
        }
        const QString key = options.label.left(sep);
        return labels.contains(key)
               && labels.value(key).toString() == options.label.mid(sep + 1);
    }
    return true;
}

QJsonObject V3Adapter::filter(const QJsonObject& body, const Options& options) {
    if (options.apiVersion != "v3") {
        return body;
    }

    const QJsonObject node = body.value("node").toObject();
    if (node.isEmpty()) {
        return body;
    }
    if (!node.value("dir").toBool()) {
        return flattenNode(node);
    }

    QJsonArray matched;
    for (const QJsonValue& item : node.value("nodes").toArray()) {
        const QJsonObject child = item.toObject();
        if (matches(child.value("value").toObject(), options)) {
            matched.append(flattenNode(child));
        }
    }

    QJsonArray list;
    if (options.page > 0) {
        const qsizetype start = static_cast<qsizetype>(options.page - 1) * options.pageSize;
        for (qsizetype i = start; i < matched.size() && i < start + options.pageSize; ++i) {
            list.append(matched.at(i));
        }
    } else {
        list = matched;
    }

    return QJsonObject{{"list", list}, {"total", matched.size()}};
}

} // namespace pluginconf
