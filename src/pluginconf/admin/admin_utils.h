#pragma once

#include <QJsonObject>
#include <QString>

#include <functional>

namespace pluginconf {

/// Epoch seconds source; replaced in tests.
using Clock = std::function<qint64()>;

qint64 systemClockSeconds();

/// Sets update_time to now and create_time to the one recorded in previous,
/// or now when previous has none. Caller-supplied values are overwritten.
void injectTimestamps(QJsonObject& conf, const QJsonObject& previous, const Clock& clock);

/// Makes "count" agree with the body: the number of items for a directory
/// read, 1 for a single node.
void fixCount(QJsonObject& body, const QString& id);

} // namespace pluginconf
