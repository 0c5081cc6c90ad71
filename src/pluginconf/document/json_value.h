#pragma once

#include <QJsonValue>
#include <QString>

namespace pluginconf {

/// Largest integer a JSON number carries exactly (2^53).
constexpr qint64 kMaxSafeInteger = 9007199254740992LL;

/// Integral value of a JSON number inside [min, max]. False for
/// non-numbers, fractions and anything out of range; out is then untouched.
bool jsonToInteger(const QJsonValue& value, qint64 min, qint64 max, qint64& out);

/// String form of a JSON scalar: strings as-is, integral numbers without a
/// fraction ("1", not "1.0"), anything else empty.
QString jsonScalarToString(const QJsonValue& value);

/// Compact JSON text of any value, scalars included.
QString encodeJsonValue(const QJsonValue& value);

} // namespace pluginconf
