#pragma once

#include <memory>

#include <QString>

namespace fasting {
namespace data {
class DataProvider;
class FastingWindowStore;
}
namespace notify {
class NotificationScheduler;
class TimerNotificationCenter;
}

namespace core {

class NotificationPreferences;
class TimelineReconciler;

// Owns the production object graph: SQLite store, preferences, in-process
// reminder delivery and the timeline on top of them.
class AppContext
{
public:
    explicit AppContext(const QString &databasePath = QString());
    ~AppContext();

    QString databasePath() const;
    data::FastingWindowStore &store();
    NotificationPreferences &preferences();
    notify::TimerNotificationCenter &notificationCenter();
    notify::NotificationScheduler &notificationScheduler();
    TimelineReconciler &timeline();

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<NotificationPreferences> m_preferences;
    std::unique_ptr<notify::TimerNotificationCenter> m_notificationCenter;
    std::unique_ptr<notify::NotificationScheduler> m_notificationScheduler;
    std::unique_ptr<TimelineReconciler> m_timeline;
};

} // namespace core
} // namespace fasting
