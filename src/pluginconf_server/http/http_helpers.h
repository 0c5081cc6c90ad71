#pragma once

#include <QHttpServerResponse>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "pluginconf/admin/admin_result.h"

namespace pluginconf_server {

inline QHttpServerResponse jsonResponse(
    const QJsonObject& obj,
    QHttpServerResponse::StatusCode code = QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json",
        QJsonDocument(obj).toJson(QJsonDocument::Compact),
        code);
}

inline QHttpServerResponse errorResponse(QHttpServerResponse::StatusCode code,
                                         const QString& message) {
    return jsonResponse(QJsonObject{{"error_msg", message}}, code);
}

inline QHttpServerResponse adminResponse(const pluginconf::AdminResult& result) {
    return jsonResponse(result.body,
                        static_cast<QHttpServerResponse::StatusCode>(result.status));
}

} // namespace pluginconf_server
