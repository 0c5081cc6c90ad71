#include "field_schema.h"

#include <QFile>
#include <QJsonDocument>
#include <QSet>

using pluginconf::meta::Constraints;
using pluginconf::meta::FieldMeta;
using pluginconf::meta::fieldTypeFromString;

namespace pluginconf {

namespace {

bool isKnownFieldType(const QString& typeStr) {
    static const QSet<QString> known = {"string", "int",     "integer", "int64", "double", "number",
                                        "bool",   "boolean", "object",  "array", "enum",   "any"};
    return known.contains(typeStr);
}

bool parseDescriptor(const QString& fieldName,
                     const QString& fieldPath,
                     const QJsonObject& desc,
                     FieldMeta& field,
                     QString& error);

FieldSchema parseObject(const QJsonObject& obj, const QString& pathPrefix, QString& error) {
    FieldSchema schema;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const QString& fieldName = it.key();
        const QString fieldPath = pathPrefix.isEmpty() ? fieldName : (pathPrefix + "." + fieldName);
        if (!it.value().isObject()) {
            error = QString("field descriptor for \"%1\" must be a JSON object").arg(fieldPath);
            return {};
        }

        FieldMeta field;
        if (!parseDescriptor(fieldName, fieldPath, it.value().toObject(), field, error)) {
            return {};
        }
        schema.fields.append(field);
    }
    return schema;
}

bool parseDescriptor(const QString& fieldName,
                     const QString& fieldPath,
                     const QJsonObject& desc,
                     FieldMeta& field,
                     QString& error) {
    const QString typeStr = desc.value("type").toString("any");
    if (!isKnownFieldType(typeStr)) {
        error = QString("unknown field type \"%1\" for field \"%2\"").arg(typeStr, fieldPath);
        return false;
    }

    field.name = fieldName;
    field.type = fieldTypeFromString(typeStr);
    field.required = desc.value("required").toBool(false);
    field.additionalProperties = desc.value("additionalProperties").toBool(true);

    if (desc.contains("default")) {
        field.defaultValue = desc.value("default");
    }

    if (desc.contains("constraints")) {
        if (!desc.value("constraints").isObject()) {
            error = QString("\"constraints\" for field \"%1\" must be a JSON object").arg(fieldPath);
            return false;
        }
        field.constraints = Constraints::fromJson(desc.value("constraints").toObject());
    }

    if (desc.contains("items")) {
        if (!desc.value("items").isObject()) {
            error = QString("\"items\" for field \"%1\" must be a JSON object").arg(fieldPath);
            return false;
        }
        auto itemMeta = std::make_shared<FieldMeta>();
        if (!parseDescriptor(fieldName, fieldPath + "[]", desc.value("items").toObject(),
                             *itemMeta, error)) {
            return false;
        }
        field.items = itemMeta;
    }

    if (desc.contains("values")) {
        if (!desc.value("values").isObject()) {
            error = QString("\"values\" for field \"%1\" must be a JSON object").arg(fieldPath);
            return false;
        }
        auto valueMeta = std::make_shared<FieldMeta>();
        if (!parseDescriptor(fieldName, fieldPath + ".*", desc.value("values").toObject(),
                             *valueMeta, error)) {
            return false;
        }
        field.values = valueMeta;
    }

    if (desc.contains("fields")) {
        if (!desc.value("fields").isObject()) {
            error = QString("\"fields\" for field \"%1\" must be a JSON object").arg(fieldPath);
            return false;
        }
        FieldSchema nested = parseObject(desc.value("fields").toObject(), fieldPath, error);
        if (!error.isEmpty()) {
            return false;
        }
        field.fields = nested.fields;
    }

    return true;
}

} // namespace

FieldSchema FieldSchema::fromJsonObject(const QJsonObject& obj, QString& error) {
    error.clear();
    return parseObject(obj, QString(), error);
}

FieldSchema FieldSchema::fromJsonFile(const QString& filePath, QString& error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = QString("cannot open schema file: %1").arg(filePath);
        return {};
    }
    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseErr;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = QString("schema parse error: %1").arg(parseErr.errorString());
        return {};
    }
    if (!doc.isObject()) {
        error = "schema file must be a JSON object";
        return {};
    }

    error.clear();
    return parseObject(doc.object(), QString(), error);
}

} // namespace pluginconf
