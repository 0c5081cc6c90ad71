#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace pluginconf {

class JsonPatch {
public:
    /// Recursive merge: objects merge into objects, every other value
    /// (null included) overwrites. Keys missing from patch are kept.
    static QJsonObject merge(const QJsonObject& base, const QJsonObject& patch);

    /// Sets value at the location addressed by subPath ("a/b/c").
    /// Intermediate segments must name existing objects or in-range array
    /// indexes. When the target and value are both objects, the value's keys
    /// are set onto the target. An empty path replaces the document.
    /// On failure doc is untouched and error holds "invalid sub-path: /...".
    static bool patch(QJsonObject& doc,
                      const QString& subPath,
                      const QJsonValue& value,
                      QString& error);
};

} // namespace pluginconf
