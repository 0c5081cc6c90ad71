#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "admin_result.h"
#include "admin_utils.h"
#include "v3_adapter.h"

namespace pluginconf {

class KvStore;
class PluginSchemaRegistry;
class RouteSnapshotProvider;

/// Lifecycle of plugin config resources stored under /plugin_configs.
///
/// Stateless between calls: every operation talks to the store afresh, and
/// concurrent patches are kept apart only by the store's compare-and-swap.
class PluginConfigController {
public:
    struct Options {
        QString keyPrefix = "/plugin_configs";
        QString apiVersion = "v3";
        Clock clock;
    };

    PluginConfigController(KvStore* store,
                           const PluginSchemaRegistry* registry,
                           RouteSnapshotProvider* routes,
                           const Options& options = Options());

    /// Identity rules plus composite and plugins-map validation. On success
    /// checked holds the canonical document (id stamped, plugin defaults
    /// filled) and the returned result is ok().
    AdminResult checkConf(const QString& id,
                          const QJsonValue& conf,
                          bool requireId,
                          QJsonObject& checked) const;

    /// Full replace. The id comes from the argument or the document.
    AdminResult put(const QString& id, const QJsonValue& conf);

    /// Create under a store-allocated id.
    AdminResult post(const QJsonValue& conf);

    /// Single read, or the collection when id is empty.
    AdminResult get(const QString& id, const V3Adapter::Options& query = V3Adapter::Options());

    AdminResult remove(const QString& id);

    /// Read-modify-write conditioned on the modifiedIndex that was read.
    /// Empty subPath merges conf into the stored document; otherwise conf
    /// is applied at subPath.
    AdminResult patch(const QString& id, const QJsonValue& conf, const QString& subPath);

    const Options& options() const { return m_options; }

private:
    QString keyFor(const QString& id) const;
    AdminResult storeFailure(const char* op, const QString& key, const QString& error) const;

    KvStore* m_store = nullptr;
    const PluginSchemaRegistry* m_registry = nullptr;
    RouteSnapshotProvider* m_routes = nullptr;
    Options m_options;
};

} // namespace pluginconf
