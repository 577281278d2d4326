#include "fasting/data/FastingWindow.hpp"

#include <algorithm>

namespace fasting {
namespace data {

QString windowTypeToString(WindowType type)
{
    switch (type) {
    case WindowType::Fast:
        return QStringLiteral("fast");
    case WindowType::Eat:
        return QStringLiteral("eat");
    }
    return QStringLiteral("fast");
}

std::optional<WindowType> windowTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("fast")) {
        return WindowType::Fast;
    }
    if (normalized == QLatin1String("eat")) {
        return WindowType::Eat;
    }
    return std::nullopt;
}

QString windowSourceToString(WindowSource source)
{
    return source == WindowSource::System ? QStringLiteral("system") : QStringLiteral("user");
}

WindowSource windowSourceFromString(const QString &value)
{
    if (value.compare(QLatin1String("system"), Qt::CaseInsensitive) == 0) {
        return WindowSource::System;
    }
    return WindowSource::User;
}

qint64 FastingWindow::durationSecs() const
{
    if (!start.isValid() || !end.isValid()) {
        return 0;
    }
    return std::max<qint64>(start.secsTo(end), 0);
}

bool FastingWindow::contains(const QDateTime &instant) const
{
    return start <= instant && instant < end;
}

bool FastingWindow::intersects(const QDateTime &from, const QDateTime &to) const
{
    return start < to && end > from;
}

qint64 FastingWindow::overlapMSecs(const QDateTime &from, const QDateTime &to) const
{
    const QDateTime overlapStart = std::max(start, from);
    const QDateTime overlapEnd = std::min(end, to);
    if (overlapEnd <= overlapStart) {
        return 0;
    }
    return overlapStart.msecsTo(overlapEnd);
}

} // namespace data
} // namespace fasting
