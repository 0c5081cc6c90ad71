#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>
#include <optional>

namespace pluginconf::meta {

/**
 * Field value types understood by the validator
 */
enum class FieldType {
    String,
    Int,     // 32-bit integer
    Int64,   // integer within the JSON safe range
    Double,
    Bool,
    Object,
    Array,
    Enum,    // string restricted to enumValues
    Any
};

FieldType fieldTypeFromString(const QString& str);

/**
 * Field constraints
 */
struct Constraints {
    std::optional<double> min;
    std::optional<double> max;
    std::optional<int> minLength;
    std::optional<int> maxLength;
    QString pattern;
    QJsonArray enumValues;
    std::optional<int> minItems;
    std::optional<int> maxItems;

    static Constraints fromJson(const QJsonObject& obj);
};

/**
 * Field metadata
 */
struct FieldMeta {
    QString name;
    FieldType type = FieldType::Any;
    bool required = false;
    QJsonValue defaultValue;
    Constraints constraints;
    QVector<FieldMeta> fields;            // nested Object fields
    std::shared_ptr<FieldMeta> items;     // Array element schema
    std::shared_ptr<FieldMeta> values;    // schema of every value of a map-like Object
    bool additionalProperties = true;
};

} // namespace pluginconf::meta
