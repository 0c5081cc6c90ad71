#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>

#include "field_schema.h"

namespace pluginconf {

/// Known plugins and the schema of their settings.
class PluginSchemaRegistry {
public:
    struct LoadStats {
        int loaded = 0;
        int invalid = 0;
    };

    void registerPlugin(const QString& name, const FieldSchema& schema);
    QStringList pluginNames() const { return m_schemas.keys(); }

    /// Registers every <name>.schema.json found in dir. Invalid files are
    /// skipped with a warning.
    LoadStats loadFromDirectory(const QString& dir);

    /// Checks a plugins map and fills schema defaults into it.
    /// On failure plugins is left untouched.
    bool checkPlugins(QJsonObject& plugins, QString& error) const;

    static const FieldSchema& metaSchema();

private:
    bool checkPlugin(const QString& name, QJsonObject& conf, QString& error) const;

    QMap<QString, FieldSchema> m_schemas;
};

} // namespace pluginconf
