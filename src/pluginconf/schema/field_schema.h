#pragma once

#include <QJsonObject>
#include <QVector>
#include "meta_types.h"

namespace pluginconf {

struct FieldSchema {
    QVector<meta::FieldMeta> fields;

    /// Parse a field descriptor map:
    /// key = field name, value = {type, required, default,
    /// constraints, items, fields, values, additionalProperties}
    static FieldSchema fromJsonObject(const QJsonObject& obj, QString& error);

    /// Load a descriptor map from a *.schema.json file
    static FieldSchema fromJsonFile(const QString& filePath, QString& error);
};

} // namespace pluginconf
