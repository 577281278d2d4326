#pragma once

#include <optional>

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace fasting {
namespace data {

enum class WindowType
{
    Fast,
    Eat,
};

// Provenance of a stored window. System windows are planned continuations
// the timeline may reposition silently.
enum class WindowSource
{
    User,
    System,
};

QString windowTypeToString(WindowType type);
std::optional<WindowType> windowTypeFromString(const QString &value);
QString windowSourceToString(WindowSource source);
WindowSource windowSourceFromString(const QString &value);

// Half-open interval [start, end) tagged fast or eat.
struct FastingWindow
{
    QUuid id = QUuid::createUuid();
    WindowType type = WindowType::Fast;
    QDateTime start;
    QDateTime end;
    QString note;
    WindowSource source = WindowSource::User;
    QDateTime createdAt;
    QDateTime updatedAt;

    qint64 durationSecs() const;
    bool contains(const QDateTime &instant) const;
    bool intersects(const QDateTime &from, const QDateTime &to) const;
    qint64 overlapMSecs(const QDateTime &from, const QDateTime &to) const;
};

} // namespace data
} // namespace fasting
