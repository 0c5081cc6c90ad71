#pragma once

#include <QJsonObject>
#include <QString>

class QUrlQuery;

namespace pluginconf {

/// Reshapes store read responses for admin API v3 clients.
class V3Adapter {
public:
    struct Options {
        QString apiVersion = "v3";
        int page = 0;        // 0 disables paging
        int pageSize = 0;
        QString name;        // substring match on value.name
        QString label;       // "key" or "key:value"
    };

    static constexpr int kMinPageSize = 10;
    static constexpr int kMaxPageSize = 500;

    /// Reads page, page_size, name and label from a request query.
    static bool parseQuery(const QUrlQuery& query, Options& options, QString& error);

    /// v3 turns a single node into {key, value, createdIndex, modifiedIndex}
    /// and a directory into {list, total}. Other versions pass through.
    static QJsonObject filter(const QJsonObject& body, const Options& options);

private:
    static QJsonObject flattenNode(const QJsonObject& node);
    static bool matches(const QJsonObject& value, const Options& options);
};

} // namespace pluginconf
