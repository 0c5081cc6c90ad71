#include "route_snapshot.h"

#include "pluginconf/document/json_value.h"

namespace pluginconf {

bool RouteEntry::hasPluginConfig() const {
    return !pluginConfigIdString().isEmpty();
}

QString RouteEntry::pluginConfigIdString() const {
    return jsonScalarToString(pluginConfigId);
}

RouteEntry RouteEntry::fromJson(const QJsonObject& value) {
    RouteEntry entry;
    entry.id = jsonScalarToString(value.value("id"));
    entry.pluginConfigId = value.value("plugin_config_id");
    return entry;
}

} // namespace pluginconf
