#include "plugin_config_controller.h"

#include <QDebug>
#include <QVector>

#include "pluginconf/document/json_patch.h"
#include "pluginconf/document/json_value.h"
#include "pluginconf/route/route_snapshot.h"
#include "pluginconf/schema/plugin_config_schema.h"
#include "pluginconf/schema/plugin_schema_registry.h"
#include "pluginconf/store/kv_store.h"

namespace pluginconf {

namespace {

constexpr int kBadRequest = 400;
constexpr int kConflict = 409;
constexpr int kServiceUnavailable = 503;
constexpr int kPreconditionFailed = 412;

} // namespace

PluginConfigController::PluginConfigController(KvStore* store,
                                               const PluginSchemaRegistry* registry,
                                               RouteSnapshotProvider* routes,
                                               const Options& options)
    : m_store(store), m_registry(registry), m_routes(routes), m_options(options) {
    if (!m_options.clock) {
        m_options.clock = systemClockSeconds;
    }
}

QString PluginConfigController::keyFor(const QString& id) const {
    if (id.isEmpty()) {
        return m_options.keyPrefix;
    }
    return m_options.keyPrefix + "/" + id;
}

AdminResult PluginConfigController::storeFailure(const char* op,
                                                 const QString& key,
                                                 const QString& error) const {
    qCritical("failed to %s plugin config[%s]: %s", op, qUtf8Printable(key),
              qUtf8Printable(error));
    return AdminResult::fail(AdminError::DependencyError, kServiceUnavailable, error);
}

AdminResult PluginConfigController::checkConf(const QString& id,
                                              const QJsonValue& conf,
                                              bool requireId,
                                              QJsonObject& checked) const {
    if (!conf.isObject()) {
        return AdminResult::fail(AdminError::MissingConfiguration, kBadRequest,
                                 "missing configurations");
    }

    QJsonObject doc = conf.toObject();
    const QJsonValue rawId = doc.value("id");
    const QString docId = jsonScalarToString(rawId);
    const QString resolved = id.isEmpty() ? docId : id;

    if (!requireId && (!resolved.isEmpty() || doc.contains("id"))) {
        return AdminResult::fail(AdminError::UnexpectedId, kBadRequest,
                                 "wrong id, do not need it");
    }
    // an id that has no string form can never equal the path id
    if (doc.contains("id") && !rawId.isString() && !rawId.isDouble()) {
        if (!id.isEmpty()) {
            return AdminResult::fail(AdminError::IdMismatch, kBadRequest, "wrong id");
        }
        return AdminResult::fail(AdminError::SchemaViolation, kBadRequest,
                                 "invalid configuration: id: expected string");
    }
    if (requireId && resolved.isEmpty()) {
        return AdminResult::fail(AdminError::MissingId, kBadRequest, "missing id");
    }
    if (!id.isEmpty() && !docId.isEmpty() && id != docId) {
        return AdminResult::fail(AdminError::IdMismatch, kBadRequest, "wrong id");
    }

    if (!resolved.isEmpty()) {
        doc["id"] = resolved;
    }

    const auto result = PluginConfigSchema::validate(doc);
    if (!result.valid) {
        return AdminResult::fail(AdminError::SchemaViolation, kBadRequest,
                                 "invalid configuration: " + result.toString());
    }

    QJsonObject plugins = doc.value("plugins").toObject();
    QString error;
    if (!m_registry->checkPlugins(plugins, error)) {
        return AdminResult::fail(AdminError::SchemaViolation, kBadRequest, error);
    }
    doc["plugins"] = plugins;

    checked = doc;
    return AdminResult::pass(200, QJsonObject());
}

AdminResult PluginConfigController::put(const QString& id, const QJsonValue& conf) {
    QJsonObject doc;
    AdminResult checked = checkConf(id, conf, true, doc);
    if (!checked.ok()) {
        return checked;
    }

    const QString key = keyFor(doc.value("id").toString());
    QString error;

    StoreResponse previous;
    if (!m_store->get(key, false, previous, error)) {
        return storeFailure("get", key, error);
    }
    injectTimestamps(doc,
                     previous.body.value("node").toObject().value("value").toObject(),
                     m_options.clock);

    StoreResponse res;
    if (!m_store->set(key, doc, res, error)) {
        return storeFailure("put", key, error);
    }
    qInfo("plugin config %s stored (status %d)", qUtf8Printable(key), res.status);
    return AdminResult::pass(res.status, res.body);
}

AdminResult PluginConfigController::post(const QJsonValue& conf) {
    QJsonObject doc;
    AdminResult checked = checkConf(QString(), conf, false, doc);
    if (!checked.ok()) {
        return checked;
    }

    QString id;
    QString error;
    if (!m_store->allocateId(id, error)) {
        return storeFailure("post", m_options.keyPrefix, error);
    }
    doc["id"] = id;
    injectTimestamps(doc, QJsonObject(), m_options.clock);

    const QString key = keyFor(id);
    StoreResponse res;
    if (!m_store->set(key, doc, res, error)) {
        return storeFailure("post", key, error);
    }
    qInfo("plugin config %s created (status %d)", qUtf8Printable(key), res.status);
    return AdminResult::pass(res.status, res.body);
}

AdminResult PluginConfigController::get(const QString& id, const V3Adapter::Options& query) {
    const QString key = keyFor(id);
    StoreResponse res;
    QString error;
    if (!m_store->get(key, id.isEmpty(), res, error)) {
        return storeFailure("get", key, error);
    }
    if (res.status != 200) {
        return AdminResult::pass(res.status, res.body);
    }

    QJsonObject body = res.body;
    fixCount(body, id);

    V3Adapter::Options options = query;
    options.apiVersion = m_options.apiVersion;
    return AdminResult::pass(res.status, V3Adapter::filter(body, options));
}

AdminResult PluginConfigController::remove(const QString& id) {
    if (id.isEmpty()) {
        return AdminResult::fail(AdminError::MissingId, kBadRequest,
                                 "missing plugin config id");
    }

    QVector<RouteEntry> routes;
    qint64 version = 0;
    QString error;
    if (!m_routes->list(routes, version, error)) {
        qCritical("failed to read routes before deleting plugin config %s: %s",
                  qUtf8Printable(id), qUtf8Printable(error));
        return AdminResult::fail(AdminError::DependencyError, kServiceUnavailable, error);
    }

    // The snapshot may lag the store: a route created after this scan is not seen.
    for (const RouteEntry& route : routes) {
        if (route.hasPluginConfig() && route.pluginConfigIdString() == id) {
            return AdminResult::fail(
                AdminError::ResourceInUse, kBadRequest,
                QString("can not delete this plugin config, route [%1] is still using it now")
                    .arg(route.id));
        }
    }

    const QString key = keyFor(id);
    StoreResponse res;
    if (!m_store->remove(key, res, error)) {
        return storeFailure("delete", key, error);
    }
    if (res.status == 200) {
        qInfo("plugin config %s deleted (routes version %lld)", qUtf8Printable(key),
              static_cast<long long>(version));
    }
    return AdminResult::pass(res.status, res.body);
}

AdminResult PluginConfigController::patch(const QString& id,
                                          const QJsonValue& conf,
                                          const QString& subPath) {
    if (id.isEmpty()) {
        return AdminResult::fail(AdminError::MissingId, kBadRequest,
                                 "missing plugin config id");
    }
    // a null body is a value to store when a sub-path addresses it
    if (conf.isUndefined() || (subPath.isEmpty() && conf.isNull())) {
        return AdminResult::fail(AdminError::MissingConfiguration, kBadRequest,
                                 "missing new configuration");
    }
    if (subPath.isEmpty() && !conf.isObject()) {
        return AdminResult::fail(AdminError::SchemaViolation, kBadRequest,
                                 "invalid configuration");
    }

    const QString key = keyFor(id);
    StoreResponse current;
    QString error;
    if (!m_store->get(key, false, current, error)) {
        return storeFailure("get", key, error);
    }
    if (current.status != 200) {
        return AdminResult::pass(current.status, current.body);
    }

    const QJsonObject node = current.body.value("node").toObject();
    const QJsonObject base = node.value("value").toObject();
    const qint64 modifiedIndex = static_cast<qint64>(node.value("modifiedIndex").toDouble());

    QJsonObject candidate = base;
    if (subPath.isEmpty()) {
        candidate = JsonPatch::merge(base, conf.toObject());
    } else if (!JsonPatch::patch(candidate, subPath, conf, error)) {
        return AdminResult::fail(AdminError::InvalidPatchPath, kBadRequest, error);
    }

    injectTimestamps(candidate, base, m_options.clock);

    QJsonObject doc;
    AdminResult checked = checkConf(id, candidate, true, doc);
    if (!checked.ok()) {
        return checked;
    }

    StoreResponse res;
    if (!m_store->atomicSet(key, doc, modifiedIndex, res, error)) {
        return storeFailure("patch", key, error);
    }
    if (res.status == kPreconditionFailed) {
        const QString message = res.body.value("message").toString() + " "
                                + res.body.value("cause").toString();
        qWarning("plugin config %s changed concurrently: %s", qUtf8Printable(key),
                 qUtf8Printable(message));
        return AdminResult::fail(AdminError::ConcurrencyConflict, kConflict, message);
    }
    return AdminResult::pass(res.status, res.body);
}

} // namespace pluginconf
