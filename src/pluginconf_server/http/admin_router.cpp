#include "admin_router.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QUrlQuery>

#include "http_helpers.h"
#include "pluginconf/admin/plugin_config_controller.h"

using Method = QHttpServerRequest::Method;
using pluginconf::AdminResult;
using pluginconf::V3Adapter;

namespace pluginconf_server {

AdminRouter::AdminRouter(pluginconf::PluginConfigController* controller, QObject* parent)
    : QObject(parent), m_controller(controller) {}

bool AdminRouter::parseJsonBody(const QByteArray& body, QJsonValue& out, QString& error) {
    const QByteArray trimmed = body.trimmed();
    if (trimmed.isEmpty()) {
        out = QJsonValue(QJsonValue::Undefined);
        error.clear();
        return true;
    }

    // wrapped so that scalar bodies parse too
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson("[" + trimmed + "]", &parseErr);
    if (parseErr.error != QJsonParseError::NoError || doc.array().size() != 1) {
        error = "invalid request body";
        return false;
    }

    out = doc.array().at(0);
    error.clear();
    return true;
}

void AdminRouter::registerRoutes(QHttpServer& server) {
    const QString base = kBasePath;
    const QString item = base + "/<arg>";

    server.route(base, Method::Get,
                 [this](const QHttpServerRequest& req) { return handleList(req); });
    server.route(base, Method::Put,
                 [this](const QHttpServerRequest& req) { return handlePut(QString(), req); });
    server.route(base, Method::Post,
                 [this](const QHttpServerRequest& req) { return handlePost(req); });

    server.route(item, Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleGet(id, req);
                 });
    server.route(item, Method::Put,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handlePut(id, req);
                 });
    server.route(item, Method::Delete,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleDelete(id, req);
                 });
    server.route(item, Method::Patch,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handlePatch(id, QString(), req);
                 });

    // PATCH /<id>/<sub/path> spans several segments
    server.setMissingHandler(
        this, [this](const QHttpServerRequest& req, QHttpServerResponder& responder) {
            handleMissing(req, responder);
        });
}

QHttpServerResponse AdminRouter::handleList(const QHttpServerRequest& req) {
    V3Adapter::Options options;
    QString error;
    if (!V3Adapter::parseQuery(req.query(), options, error)) {
        return errorResponse(QHttpServerResponse::StatusCode::BadRequest, error);
    }
    return adminResponse(m_controller->get(QString(), options));
}

QHttpServerResponse AdminRouter::handleGet(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    return adminResponse(m_controller->get(id));
}

QHttpServerResponse AdminRouter::handlePut(const QString& id, const QHttpServerRequest& req) {
    QJsonValue body;
    QString error;
    if (!parseJsonBody(req.body(), body, error)) {
        return errorResponse(QHttpServerResponse::StatusCode::BadRequest, error);
    }
    return adminResponse(m_controller->put(id, body));
}

QHttpServerResponse AdminRouter::handlePost(const QHttpServerRequest& req) {
    QJsonValue body;
    QString error;
    if (!parseJsonBody(req.body(), body, error)) {
        return errorResponse(QHttpServerResponse::StatusCode::BadRequest, error);
    }
    return adminResponse(m_controller->post(body));
}

QHttpServerResponse AdminRouter::handleDelete(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    return adminResponse(m_controller->remove(id));
}

QHttpServerResponse AdminRouter::handlePatch(const QString& id,
                                             const QString& subPath,
                                             const QHttpServerRequest& req) {
    QJsonValue body;
    QString error;
    if (!parseJsonBody(req.body(), body, error)) {
        return errorResponse(QHttpServerResponse::StatusCode::BadRequest, error);
    }
    return adminResponse(m_controller->patch(id, body, subPath));
}

void AdminRouter::handleMissing(const QHttpServerRequest& req, QHttpServerResponder& responder) {
    const QString prefix = QString(kBasePath) + "/";
    const QString path = req.url().path();

    if (req.method() == Method::Patch && path.startsWith(prefix)) {
        const QString rest = path.mid(prefix.size());
        const int sep = rest.indexOf('/');
        if (sep > 0) {
            const QString id = rest.left(sep);
            const QString subPath = rest.mid(sep + 1);
            responder.sendResponse(handlePatch(id, subPath, req));
            return;
        }
    }

    qDebug("AdminRouter: no route for %s", qUtf8Printable(path));
    responder.sendResponse(
        errorResponse(QHttpServerResponse::StatusCode::NotFound, "not found"));
}

} // namespace pluginconf_server
