#include "plugin_schema_registry.h"

#include <QDebug>
#include <QDir>
#include <QRegularExpression>

#include "pluginconf/document/json_value.h"
#include "meta_validator.h"

using pluginconf::meta::DefaultFiller;
using pluginconf::meta::FieldMeta;
using pluginconf::meta::FieldType;
using pluginconf::meta::MetaValidator;

namespace pluginconf {

namespace {

constexpr const char* kSchemaSuffix = ".schema.json";
constexpr const char* kMetaKey = "_meta";

bool isValidPluginName(const QString& name) {
    static const QRegularExpression re("^[A-Za-z0-9_-]+$");
    return re.match(name).hasMatch();
}

FieldSchema buildMetaSchema() {
    FieldMeta disable;
    disable.name = "disable";
    disable.type = FieldType::Bool;

    FieldMeta priority;
    priority.name = "priority";
    priority.type = FieldType::Int;

    FieldMeta filter;
    filter.name = "filter";
    filter.type = FieldType::Array;

    FieldMeta errorResponse;
    errorResponse.name = "error_response";
    errorResponse.type = FieldType::Any;

    FieldSchema schema;
    schema.fields = {disable, priority, filter, errorResponse};
    return schema;
}

} // namespace

const FieldSchema& PluginSchemaRegistry::metaSchema() {
    static const FieldSchema s = buildMetaSchema();
    return s;
}

void PluginSchemaRegistry::registerPlugin(const QString& name, const FieldSchema& schema) {
    m_schemas.insert(name, schema);
}

PluginSchemaRegistry::LoadStats PluginSchemaRegistry::loadFromDirectory(const QString& dir) {
    LoadStats stats;

    QDir schemaDir(dir);
    if (!schemaDir.exists()) {
        return stats;
    }

    const auto entries = schemaDir.entryList({QString("*") + kSchemaSuffix}, QDir::Files);
    for (const QString& entry : entries) {
        const QString name = entry.chopped(static_cast<int>(qstrlen(kSchemaSuffix)));
        if (!isValidPluginName(name)) {
            qWarning("PluginSchemaRegistry: skip invalid plugin name: %s", qUtf8Printable(entry));
            stats.invalid++;
            continue;
        }

        QString error;
        const FieldSchema schema = FieldSchema::fromJsonFile(schemaDir.absoluteFilePath(entry), error);
        if (!error.isEmpty()) {
            qWarning("PluginSchemaRegistry: %s invalid: %s",
                     qUtf8Printable(name),
                     qUtf8Printable(error));
            stats.invalid++;
            continue;
        }

        registerPlugin(name, schema);
        stats.loaded++;
    }

    return stats;
}

bool PluginSchemaRegistry::checkPlugin(const QString& name,
                                       QJsonObject& conf,
                                       QString& error) const {
    auto it = m_schemas.constFind(name);
    if (it == m_schemas.constEnd()) {
        error = "unknown plugin [" + name + "]";
        return false;
    }

    if (conf.contains(kMetaKey)) {
        if (!conf.value(kMetaKey).isObject()) {
            error = "failed to check the configuration of plugin " + name
                    + " err: _meta: expected object";
            return false;
        }
        const auto metaResult =
            MetaValidator::validateObject(conf.value(kMetaKey).toObject(), metaSchema().fields,
                                          false);
        if (!metaResult.valid) {
            error = "failed to check the configuration of plugin " + name
                    + " err: _meta." + metaResult.toString();
            return false;
        }
    }

    QJsonObject settings = conf;
    settings.remove(kMetaKey);
    settings = DefaultFiller::fillDefaults(settings, it.value().fields);

    const auto result = MetaValidator::validateObject(settings, it.value().fields, true);
    if (!result.valid) {
        error = "failed to check the configuration of plugin " + name + " err: "
                + result.toString();
        return false;
    }

    if (conf.contains(kMetaKey)) {
        settings.insert(kMetaKey, conf.value(kMetaKey));
    }
    conf = settings;
    return true;
}

bool PluginSchemaRegistry::checkPlugins(QJsonObject& plugins, QString& error) const {
    QJsonObject checked;
    for (auto it = plugins.begin(); it != plugins.end(); ++it) {
        if (!it.value().isObject()) {
            error = QString("invalid plugin conf %1 for plugin [%2]")
                        .arg(encodeJsonValue(it.value()), it.key());
            return false;
        }

        QJsonObject conf = it.value().toObject();
        if (!checkPlugin(it.key(), conf, error)) {
            return false;
        }
        checked.insert(it.key(), conf);
    }

    plugins = checked;
    error.clear();
    return true;
}

} // namespace pluginconf
