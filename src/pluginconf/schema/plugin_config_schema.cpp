#include "plugin_config_schema.h"

using pluginconf::meta::FieldMeta;
using pluginconf::meta::FieldType;
using pluginconf::meta::MetaValidator;
using pluginconf::meta::ValidationResult;

namespace pluginconf {

namespace {

constexpr const char* kIdPattern = "^[a-zA-Z0-9_.-]+$";

FieldSchema buildSchema() {
    FieldMeta id;
    id.name = "id";
    id.type = FieldType::String;
    id.constraints.minLength = 1;
    id.constraints.maxLength = 64;
    id.constraints.pattern = kIdPattern;

    FieldMeta name;
    name.name = "name";
    name.type = FieldType::String;
    name.constraints.minLength = 1;
    name.constraints.maxLength = 100;

    FieldMeta desc;
    desc.name = "desc";
    desc.type = FieldType::String;
    desc.constraints.maxLength = 256;

    auto labelValue = std::make_shared<FieldMeta>();
    labelValue->type = FieldType::String;
    labelValue->constraints.minLength = 1;
    labelValue->constraints.maxLength = 64;
    labelValue->constraints.pattern = "^\\S+$";

    FieldMeta labels;
    labels.name = "labels";
    labels.type = FieldType::Object;
    labels.values = labelValue;

    FieldMeta createTime;
    createTime.name = "create_time";
    createTime.type = FieldType::Int64;

    FieldMeta updateTime;
    updateTime.name = "update_time";
    updateTime.type = FieldType::Int64;

    FieldMeta plugins;
    plugins.name = "plugins";
    plugins.type = FieldType::Object;
    plugins.required = true;

    FieldSchema schema;
    schema.fields = {id, name, desc, labels, createTime, updateTime, plugins};
    return schema;
}

} // namespace

const FieldSchema& PluginConfigSchema::schema() {
    static const FieldSchema s = buildSchema();
    return s;
}

ValidationResult PluginConfigSchema::validate(const QJsonObject& conf) {
    return MetaValidator::validateObject(conf, schema().fields, false);
}

} // namespace pluginconf
