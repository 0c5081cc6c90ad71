#pragma once

#include "meta_types.h"

namespace pluginconf::meta {

/**
 * Validation result
 */
struct ValidationResult {
    bool valid = true;
    QString errorField;
    QString errorMessage;

    static ValidationResult ok() { return {true, {}, {}}; }

    static ValidationResult fail(const QString& field, const QString& msg) {
        return {false, field, msg};
    }

    QString toString() const {
        if (valid)
            return "OK";
        if (errorField.isEmpty())
            return errorMessage;
        return QString("%1: %2").arg(errorField, errorMessage);
    }
};

/**
 * Schema validator over FieldMeta descriptions
 */
class MetaValidator {
public:
    /**
     * Validate a single value against its field description
     */
    static ValidationResult validateField(const QJsonValue& value, const FieldMeta& field);

    /**
     * Validate an object against a field list. With allowUnknown == false,
     * keys not described by any field are rejected.
     */
    static ValidationResult validateObject(const QJsonObject& obj,
                                           const QVector<FieldMeta>& fields,
                                           bool allowUnknown);

private:
    static ValidationResult checkType(const QJsonValue& value, FieldType type);

    static ValidationResult checkConstraints(const QJsonValue& value, const FieldMeta& field);
};

/**
 * Default value filler, recursing into nested objects that are present
 */
class DefaultFiller {
public:
    static QJsonObject fillDefaults(const QJsonObject& data, const QVector<FieldMeta>& fields);
};

} // namespace pluginconf::meta
