#pragma once

#include <vector>

#include <QStringList>

#include "fasting/data/FastingWindow.hpp"

namespace fasting {
namespace notify {

class NotificationCenter;

// Keeps the center's pending reminders equal to the set derived from the
// current windows. Only identifiers in this application's namespace are touched.
class NotificationScheduler
{
public:
    explicit NotificationScheduler(NotificationCenter &center);

    bool requestAuthorizationIfNeeded();
    void updateNotifications(const std::vector<data::FastingWindow> &windows,
                             qint64 leadTimeSecs,
                             const QDateTime &reference);
    void clearAll();
    QStringList pendingIdentifiers() const;

private:
    NotificationCenter &m_center;
};

} // namespace notify
} // namespace fasting
