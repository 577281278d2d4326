#pragma once

#include <QDateTime>
#include <QtGlobal>

namespace fasting {
namespace data {

// Persisted instants are real-valued epoch seconds with millisecond precision.
inline double toEpochSeconds(const QDateTime &dateTime)
{
    return static_cast<double>(dateTime.toMSecsSinceEpoch()) / 1000.0;
}

inline QDateTime fromEpochSeconds(double seconds)
{
    return QDateTime::fromMSecsSinceEpoch(qRound64(seconds * 1000.0));
}

} // namespace data
} // namespace fasting
