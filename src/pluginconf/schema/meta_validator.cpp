#include "meta_validator.h"

#include <QRegularExpression>
#include <QSet>

#include <climits>
#include <cmath>

#include "pluginconf/document/json_value.h"

namespace pluginconf::meta {

namespace {

ValidationResult checkInteger(const QJsonValue& value, qint64 limit) {
    if (!value.isDouble()) {
        return ValidationResult::fail("", "expected integer");
    }
    qint64 n = 0;
    if (jsonToInteger(value, -limit, limit, n)) {
        return ValidationResult::ok();
    }
    const double d = value.toDouble();
    if (std::isfinite(d) && std::trunc(d) != d) {
        return ValidationResult::fail("", "expected integer, got decimal");
    }
    return ValidationResult::fail("", "integer out of range");
}

bool hasJsonType(const QJsonValue& value, FieldType type) {
    switch (type) {
    case FieldType::String:
    case FieldType::Enum:
        return value.isString();
    case FieldType::Double:
        return value.isDouble();
    case FieldType::Bool:
        return value.isBool();
    case FieldType::Object:
        return value.isObject();
    case FieldType::Array:
        return value.isArray();
    default:
        return true;
    }
}

QString expectedName(FieldType type) {
    switch (type) {
    case FieldType::String: return "string";
    case FieldType::Enum:   return "string for enum";
    case FieldType::Double: return "number";
    case FieldType::Bool:   return "boolean";
    case FieldType::Object: return "object";
    case FieldType::Array:  return "array";
    default:                return "value";
    }
}

ValidationResult checkRange(double v, const Constraints& c, const QString& name) {
    if (c.min && v < *c.min) {
        return ValidationResult::fail(name, QString("value %1 < min %2").arg(v).arg(*c.min));
    }
    if (c.max && v > *c.max) {
        return ValidationResult::fail(name, QString("value %1 > max %2").arg(v).arg(*c.max));
    }
    return ValidationResult::ok();
}

ValidationResult checkString(const QString& s, const Constraints& c, const QString& name) {
    if (c.minLength && s.length() < *c.minLength) {
        return ValidationResult::fail(name, "string too short");
    }
    if (c.maxLength && s.length() > *c.maxLength) {
        return ValidationResult::fail(name, "string too long");
    }
    if (!c.pattern.isEmpty() && !QRegularExpression(c.pattern).match(s).hasMatch()) {
        return ValidationResult::fail(name, "pattern mismatch");
    }
    return ValidationResult::ok();
}

ValidationResult checkItemCount(qsizetype n, const Constraints& c, const QString& name) {
    if (c.minItems && n < *c.minItems) {
        return ValidationResult::fail(name, "array too short");
    }
    if (c.maxItems && n > *c.maxItems) {
        return ValidationResult::fail(name, "array too long");
    }
    return ValidationResult::ok();
}

} // namespace

ValidationResult MetaValidator::checkType(const QJsonValue& value, FieldType type) {
    if (type == FieldType::Int) {
        return checkInteger(value, INT_MAX);
    }
    if (type == FieldType::Int64) {
        return checkInteger(value, kMaxSafeInteger);
    }
    if (!hasJsonType(value, type)) {
        return ValidationResult::fail("", "expected " + expectedName(type));
    }
    return ValidationResult::ok();
}

ValidationResult MetaValidator::checkConstraints(const QJsonValue& value, const FieldMeta& field) {
    const Constraints& c = field.constraints;

    if (value.isDouble()) {
        return checkRange(value.toDouble(), c, field.name);
    }
    if (value.isString()) {
        const auto result = checkString(value.toString(), c, field.name);
        if (!result.valid) {
            return result;
        }
        if (field.type == FieldType::Enum && !c.enumValues.isEmpty()
            && !c.enumValues.contains(value)) {
            return ValidationResult::fail(field.name, "invalid enum value");
        }
        return result;
    }
    if (value.isArray()) {
        return checkItemCount(value.toArray().size(), c, field.name);
    }
    return ValidationResult::ok();
}

ValidationResult MetaValidator::validateField(const QJsonValue& value, const FieldMeta& field) {
    auto result = checkType(value, field.type);
    if (!result.valid) {
        result.errorField = field.name;
        return result;
    }

    result = checkConstraints(value, field);
    if (!result.valid) {
        return result;
    }

    if (value.isObject() && field.type == FieldType::Object) {
        const QJsonObject obj = value.toObject();
        if (!field.fields.isEmpty() || !field.additionalProperties) {
            result = validateObject(obj, field.fields, field.additionalProperties);
            if (!result.valid) {
                result.errorField = field.name + "." + result.errorField;
                return result;
            }
        }
        if (field.values) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                result = validateField(it.value(), *field.values);
                if (!result.valid) {
                    result.errorField = field.name + "." + it.key();
                    return result;
                }
            }
        }
    }

    if (value.isArray() && field.items) {
        const QJsonArray arr = value.toArray();
        for (qsizetype i = 0; i < arr.size(); ++i) {
            result = validateField(arr.at(i), *field.items);
            if (!result.valid) {
                result.errorField = QString("%1[%2]").arg(field.name).arg(i);
                return result;
            }
        }
    }

    return ValidationResult::ok();
}

ValidationResult MetaValidator::validateObject(const QJsonObject& obj,
                                               const QVector<FieldMeta>& fields,
                                               bool allowUnknown) {
    QSet<QString> known;
    for (const FieldMeta& field : fields) {
        known.insert(field.name);
        if (field.required && !obj.contains(field.name)) {
            return ValidationResult::fail(field.name, "required field missing");
        }
    }

    for (const FieldMeta& field : fields) {
        const auto it = obj.constFind(field.name);
        if (it == obj.constEnd()) {
            continue;
        }
        const auto result = validateField(it.value(), field);
        if (!result.valid) {
            return result;
        }
    }

    if (!allowUnknown) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (!known.contains(it.key())) {
                return ValidationResult::fail(it.key(), "unknown field");
            }
        }
    }

    return ValidationResult::ok();
}

QJsonObject DefaultFiller::fillDefaults(const QJsonObject& data,
                                        const QVector<FieldMeta>& fields) {
    QJsonObject result = data;
    for (const FieldMeta& field : fields) {
        const auto it = result.constFind(field.name);
        if (it == result.constEnd()) {
            if (!field.defaultValue.isNull() && !field.defaultValue.isUndefined()) {
                result.insert(field.name, field.defaultValue);
            }
        } else if (field.type == FieldType::Object && !field.fields.isEmpty()
                   && it.value().isObject()) {
            result.insert(field.name, fillDefaults(it.value().toObject(), field.fields));
        }
    }
    return result;
}

} // namespace pluginconf::meta
