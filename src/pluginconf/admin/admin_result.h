#pragma once

#include <QJsonObject>
#include <QString>

namespace pluginconf {

enum class AdminError {
    None,
    MissingConfiguration,
    MissingId,
    UnexpectedId,
    IdMismatch,
    SchemaViolation,
    InvalidPatchPath,
    ResourceInUse,
    DependencyError,
    ConcurrencyConflict
};

QString adminErrorToString(AdminError error);

/// Outcome of a controller operation. On success status and body are the
/// store's own; on failure body is {"error_msg": ...}.
struct AdminResult {
    int status = 200;
    QJsonObject body;
    AdminError error = AdminError::None;

    bool ok() const { return error == AdminError::None && status < 400; }
    QString errorMessage() const { return body.value("error_msg").toString(); }

    static AdminResult pass(int status, const QJsonObject& body) {
        return {status, body, AdminError::None};
    }

    static AdminResult fail(AdminError error, int status, const QString& message) {
        return {status, QJsonObject{{"error_msg", message}}, error};
    }
};

} // namespace pluginconf
