#include "meta_types.h"

namespace pluginconf::meta {

FieldType fieldTypeFromString(const QString& str) {
    if (str == "string")
        return FieldType::String;
    if (str == "int" || str == "integer")
        return FieldType::Int;
    if (str == "int64")
        return FieldType::Int64;
    if (str == "double" || str == "number")
        return FieldType::Double;
    if (str == "bool" || str == "boolean")
        return FieldType::Bool;
    if (str == "object")
        return FieldType::Object;
    if (str == "array")
        return FieldType::Array;
    if (str == "enum")
        return FieldType::Enum;
    return FieldType::Any;
}

Constraints Constraints::fromJson(const QJsonObject& obj) {
    Constraints c;
    if (obj.contains("min"))
        c.min = obj["min"].toDouble();
    if (obj.contains("max"))
        c.max = obj["max"].toDouble();
    if (obj.contains("minLength"))
        c.minLength = obj["minLength"].toInt();
    if (obj.contains("maxLength"))
        c.maxLength = obj["maxLength"].toInt();
    c.pattern = obj["pattern"].toString();
    c.enumValues = obj["enum"].toArray();
    if (obj.contains("minItems"))
        c.minItems = obj["minItems"].toInt();
    if (obj.contains("maxItems"))
        c.maxItems = obj["maxItems"].toInt();
    return c;
}

} // namespace pluginconf::meta
