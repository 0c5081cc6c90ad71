#include "server_manager.h"

#include <QDebug>
#include <QDir>

namespace pluginconf_server {

ServerManager::ServerManager(const QString& dataRoot, const ServerConfig& config, QObject* parent)
    : QObject(parent), m_dataRoot(dataRoot), m_config(config) {}

ServerManager::~ServerManager() = default;

bool ServerManager::initialize(QString& error) {
    QDir root(m_dataRoot);
    if (!root.exists()) {
        error = "data root does not exist: " + m_dataRoot;
        return false;
    }

    m_store = std::make_unique<pluginconf::FileKvStore>(m_dataRoot + "/store");
    if (!m_store->open(error)) {
        return false;
    }

    const auto stats = m_registry.loadFromDirectory(m_dataRoot + "/plugins");
    qInfo("Plugins: %d loaded, %d invalid", stats.loaded, stats.invalid);
    if (!m_registry.pluginNames().isEmpty()) {
        qInfo("Known plugins: %s", qUtf8Printable(m_registry.pluginNames().join(", ")));
    }

    m_routeSnapshot = new pluginconf::StoreRouteSnapshot(m_store.get(), "/routes", this);
    QString refreshErr;
    if (!m_routeSnapshot->refresh(refreshErr)) {
        qWarning("Initial route refresh failed: %s", qUtf8Printable(refreshErr));
    }

    pluginconf::PluginConfigController::Options options;
    options.apiVersion = m_config.adminApiVersion;
    m_controller = std::make_unique<pluginconf::PluginConfigController>(
        m_store.get(), &m_registry, m_routeSnapshot, options);

    error.clear();
    return true;
}

void ServerManager::startRouteRefresh() {
    if (m_routeSnapshot) {
        m_routeSnapshot->start(m_config.routeRefreshIntervalMs);
        qInfo("Route snapshot refresh every %d ms", m_config.routeRefreshIntervalMs);
    }
}

void ServerManager::shutdown() {
    if (m_routeSnapshot) {
        m_routeSnapshot->stop();
    }
}

} // namespace pluginconf_server
