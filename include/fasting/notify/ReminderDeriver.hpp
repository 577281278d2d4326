#pragma once

#include <optional>
#include <vector>

#include <QString>
#include <QUuid>

#include "fasting/data/FastingWindow.hpp"
#include "fasting/notify/ReminderEvent.hpp"

namespace fasting {
namespace data {
class FastingWindowStore;
}

namespace notify {

enum class ReminderKind
{
    StartExact,
    StartReminder,
    EndExact,
    EndReminder,
};

constexpr int DefaultCandidateLimit = 6;

// Namespace shared by every reminder this application schedules.
QString reminderIdentifierPrefix();
QString reminderIdentifier(const QUuid &windowId, ReminderKind kind);
bool isOwnReminder(const QString &identifier);

// Future start/end events (and their early reminders) of the fast windows,
// ascending by fire time. Events at or before the reference instant are dropped.
std::vector<ReminderEvent> makeReminderEvents(const std::vector<data::FastingWindow> &windows,
                                              qint64 leadTimeSecs,
                                              const QDateTime &reference);

// The active fast, the fast windows of the loaded schedule and up to `limit`
// upcoming fasts from the store, deduplicated by id and sorted by start.
std::vector<data::FastingWindow> collectReminderCandidates(const data::FastingWindowStore &store,
                                                           const std::vector<data::FastingWindow> &schedule,
                                                           const std::optional<data::FastingWindow> &active,
                                                           const QDateTime &reference,
                                                           int limit = DefaultCandidateLimit);

} // namespace notify
} // namespace fasting
