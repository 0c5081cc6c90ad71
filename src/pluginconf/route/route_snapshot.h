#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>

namespace pluginconf {

struct RouteEntry {
    QString id;
    QJsonValue pluginConfigId;   // string, integer or undefined

    bool hasPluginConfig() const;
    /// String form used for comparisons with plugin config ids
    QString pluginConfigIdString() const;

    static RouteEntry fromJson(const QJsonObject& value);

    bool operator==(const RouteEntry& other) const {
        return id == other.id && pluginConfigId == other.pluginConfigId;
    }
};

/// Read-only view of the routes known to the gateway.
class RouteSnapshotProvider {
public:
    virtual ~RouteSnapshotProvider() = default;

    /// Routes as of this call plus a marker that changes whenever the
    /// route set changes. False when no snapshot is available.
    virtual bool list(QVector<RouteEntry>& routes, qint64& version, QString& error) = 0;
};

} // namespace pluginconf
