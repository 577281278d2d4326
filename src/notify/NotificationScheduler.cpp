#include "fasting/notify/NotificationScheduler.hpp"

#include <QHash>
#include <QSet>

#include "fasting/core/Logging.hpp"
#include "fasting/notify/NotificationCenter.hpp"
#include "fasting/notify/ReminderDeriver.hpp"

namespace fasting {
namespace notify {

namespace {
bool isUsable(AuthorizationStatus status)
{
    return status == AuthorizationStatus::Authorized || status == AuthorizationStatus::Provisional;
}
} // namespace

NotificationScheduler::NotificationScheduler(NotificationCenter &center)
    : m_center(center)
{
}

bool NotificationScheduler::requestAuthorizationIfNeeded()
{
    AuthorizationStatus status = m_center.authorizationStatus();
    if (status == AuthorizationStatus::NotDetermined) {
        status = m_center.requestAuthorization();
    }
    return isUsable(status);
}

void NotificationScheduler::updateNotifications(const std::vector<data::FastingWindow> &windows,
                                                qint64 leadTimeSecs,
                                                const QDateTime &reference)
{
    if (windows.empty()) {
        clearAll();
        return;
    }

    if (!requestAuthorizationIfNeeded()) {
        spdlog::debug("Notifications not authorized, skipping reminder sync");
        return;
    }

    const auto events = makeReminderEvents(windows, leadTimeSecs, reference);
    if (events.empty()) {
        clearAll();
        return;
    }

    QHash<QString, ReminderEvent> pending;
    for (const auto &request : m_center.pendingRequests()) {
        if (isOwnReminder(request.identifier)) {
            pending.insert(request.identifier, request);
        }
    }

    QSet<QString> requested;
    for (const auto &event : events) {
        requested.insert(event.identifier);
    }

    QStringList obsolete;
    for (auto it = pending.constBegin(); it != pending.constEnd(); ++it) {
        if (!requested.contains(it.key())) {
            obsolete << it.key();
        }
    }
    if (!obsolete.isEmpty()) {
        m_center.remove(obsolete);
    }

    int scheduled = 0;
    for (const auto &event : events) {
        const auto existing = pending.constFind(event.identifier);
        if (existing != pending.constEnd() && existing.value() == event) {
            continue;
        }
        if (!m_center.add(event)) {
            spdlog::warn("Failed to schedule notification {}", core::logText(event.identifier));
            continue;
        }
        ++scheduled;
    }
    spdlog::debug("Reminder sync: {} scheduled, {} cancelled, {} desired", scheduled, obsolete.size(), events.size());
}

void NotificationScheduler::clearAll()
{
    const QStringList identifiers = pendingIdentifiers();
    if (!identifiers.isEmpty()) {
        m_center.remove(identifiers);
    }
}

QStringList NotificationScheduler::pendingIdentifiers() const
{
    QStringList identifiers;
    for (const auto &request : m_center.pendingRequests()) {
        if (isOwnReminder(request.identifier)) {
            identifiers << request.identifier;
        }
    }
    return identifiers;
}

} // namespace notify
} // namespace fasting
