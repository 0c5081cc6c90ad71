#pragma once

#include <QJsonObject>
#include "field_schema.h"
#include "meta_validator.h"

namespace pluginconf {

/// Composite schema of a stored plugin configuration document.
/// Unknown top-level keys are rejected.
class PluginConfigSchema {
public:
    static const FieldSchema& schema();

    static meta::ValidationResult validate(const QJsonObject& conf);
};

} // namespace pluginconf
