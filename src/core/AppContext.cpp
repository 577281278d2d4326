#include "fasting/core/AppContext.hpp"

#include "fasting/data/DataProvider.hpp"
#include "fasting/data/FastingWindowStore.hpp"

#include "fasting/core/NotificationPreferences.hpp"
#include "fasting/core/TimelineReconciler.hpp"
#include "fasting/notify/NotificationScheduler.hpp"
#include "fasting/notify/TimerNotificationCenter.hpp"

namespace fasting {
namespace core {

AppContext::AppContext(const QString &databasePath)
    : m_dataProvider(std::make_unique<data::DataProvider>(databasePath))
    , m_preferences(std::make_unique<NotificationPreferences>())
    , m_notificationCenter(std::make_unique<notify::TimerNotificationCenter>())
    , m_notificationScheduler(std::make_unique<notify::NotificationScheduler>(*m_notificationCenter))
    , m_timeline(std::make_unique<TimelineReconciler>(m_dataProvider->store(), *m_notificationScheduler, *m_preferences))
{
}

AppContext::~AppContext() = default;

QString AppContext::databasePath() const
{
    return m_dataProvider->databasePath();
}

data::FastingWindowStore &AppContext::store()
{
    return m_dataProvider->store();
}

NotificationPreferences &AppContext::preferences()
{
    return *m_preferences;
}

notify::TimerNotificationCenter &AppContext::notificationCenter()
{
    return *m_notificationCenter;
}

notify::NotificationScheduler &AppContext::notificationScheduler()
{
    return *m_notificationScheduler;
}

TimelineReconciler &AppContext::timeline()
{
    return *m_timeline;
}

} // namespace core
} // namespace fasting
