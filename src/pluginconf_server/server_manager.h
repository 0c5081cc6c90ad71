#pragma once

#include <QObject>
#include <QString>
#include <memory>

#include "config/server_config.h"
#include "pluginconf/admin/plugin_config_controller.h"
#include "pluginconf/route/store_route_snapshot.h"
#include "pluginconf/schema/plugin_schema_registry.h"
#include "pluginconf/store/file_kv_store.h"

namespace pluginconf_server {

/// Owns the store, plugin schemas, route snapshot and controller of one
/// admin server process.
class ServerManager : public QObject {
    Q_OBJECT
public:
    explicit ServerManager(const QString& dataRoot,
                           const ServerConfig& config,
                           QObject* parent = nullptr);
    ~ServerManager() override;

    bool initialize(QString& error);
    void startRouteRefresh();
    void shutdown();

    pluginconf::PluginConfigController* controller() { return m_controller.get(); }
    pluginconf::KvStore* store() { return m_store.get(); }
    const pluginconf::PluginSchemaRegistry& registry() const { return m_registry; }
    pluginconf::StoreRouteSnapshot* routeSnapshot() { return m_routeSnapshot; }

    const QString& dataRoot() const { return m_dataRoot; }
    const ServerConfig& config() const { return m_config; }

private:
    QString m_dataRoot;
    ServerConfig m_config;
    std::unique_ptr<pluginconf::FileKvStore> m_store;
    pluginconf::PluginSchemaRegistry m_registry;
    pluginconf::StoreRouteSnapshot* m_routeSnapshot = nullptr;
    std::unique_ptr<pluginconf::PluginConfigController> m_controller;
};

} // namespace pluginconf_server
