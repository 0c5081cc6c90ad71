#pragma once

#include <QHttpServer>
#include <QHttpServerResponder>
#include <QJsonValue>
#include <QObject>

namespace pluginconf {
class PluginConfigController;
}

namespace pluginconf_server {

/// Binds /apisix/admin/plugin_configs to the plugin config controller.
class AdminRouter : public QObject {
    Q_OBJECT
public:
    static constexpr const char* kBasePath = "/apisix/admin/plugin_configs";

    explicit AdminRouter(pluginconf::PluginConfigController* controller,
                         QObject* parent = nullptr);

    void registerRoutes(QHttpServer& server);

    /// Parses a request body holding any JSON value. An empty body yields
    /// an undefined value.
    static bool parseJsonBody(const QByteArray& body, QJsonValue& out, QString& error);

private:
    QHttpServerResponse handleList(const QHttpServerRequest& req);
    QHttpServerResponse handleGet(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handlePut(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handlePost(const QHttpServerRequest& req);
    QHttpServerResponse handleDelete(const QString& id, const QHttpServerRequest& req);
    QHttpServerResponse handlePatch(const QString& id,
                                    const QString& subPath,
                                    const QHttpServerRequest& req);

    void handleMissing(const QHttpServerRequest& req, QHttpServerResponder& responder);

    pluginconf::PluginConfigController* m_controller = nullptr;
};

} // namespace pluginconf_server
