#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>

namespace fasting {
namespace notify {

struct ReminderEvent
{
    QString identifier;
    QDateTime fireTime;
    QString title;
    QString body;

    bool operator==(const ReminderEvent &other) const
    {
        return identifier == other.identifier && fireTime == other.fireTime && title == other.title
            && body == other.body;
    }
    bool operator!=(const ReminderEvent &other) const { return !(*this == other); }
};

} // namespace notify
} // namespace fasting

Q_DECLARE_METATYPE(fasting::notify::ReminderEvent)
