#include "fasting/notify/ReminderDeriver.hpp"

#include <QHash>
#include <QLocale>
#include <algorithm>

#include "fasting/data/FastingWindowStore.hpp"

namespace fasting {
namespace notify {

namespace {
QString kindName(ReminderKind kind)
{
    switch (kind) {
    case ReminderKind::StartExact:
        return QStringLiteral("startExact");
    case ReminderKind::StartReminder:
        return QStringLiteral("startReminder");
    case ReminderKind::EndExact:
        return QStringLiteral("endExact");
    case ReminderKind::EndReminder:
        return QStringLiteral("endReminder");
    }
    return QStringLiteral("startExact");
}

QString shortTime(const QDateTime &instant)
{
    return QLocale().toString(instant.time(), QLocale::ShortFormat);
}
} // namespace

QString reminderIdentifierPrefix()
{
    return QStringLiteral("fasting.switch");
}

QString reminderIdentifier(const QUuid &windowId, ReminderKind kind)
{
    return QStringLiteral("%1.%2.%3")
        .arg(reminderIdentifierPrefix(), windowId.toString(QUuid::WithoutBraces), kindName(kind));
}

bool isOwnReminder(const QString &identifier)
{
    return identifier.startsWith(reminderIdentifierPrefix() + QLatin1Char('.'));
}

std::vector<ReminderEvent> makeReminderEvents(const std::vector<data::FastingWindow> &windows,
                                              qint64 leadTimeSecs,
                                              const QDateTime &reference)
{
    const qint64 lead = std::max<qint64>(leadTimeSecs, 0);
    std::vector<ReminderEvent> events;

    for (const auto &window : windows) {
        if (window.type != data::WindowType::Fast) {
            continue;
        }

        if (window.start > reference) {
            events.push_back({reminderIdentifier(window.id, ReminderKind::StartExact),
                              window.start,
                              QStringLiteral("Start Fasting"),
                              QStringLiteral("It's time to start your fast.")});
            const QDateTime early = window.start.addSecs(-lead);
            if (lead > 0 && early > reference) {
                events.push_back({reminderIdentifier(window.id, ReminderKind::StartReminder),
                                  early,
                                  QStringLiteral("Fast Starting Soon"),
                                  QStringLiteral("Your fast begins at %1.").arg(shortTime(window.start))});
            }
        }

        if (window.end > reference) {
            events.push_back({reminderIdentifier(window.id, ReminderKind::EndExact),
                              window.end,
                              QStringLiteral("Stop Fasting"),
                              QStringLiteral("You can end your fast now.")});
            const QDateTime early = window.end.addSecs(-lead);
            if (lead > 0 && early > reference) {
                events.push_back({reminderIdentifier(window.id, ReminderKind::EndReminder),
                                  early,
                                  QStringLiteral("Fast Ending Soon"),
                                  QStringLiteral("Your fast ends at %1.").arg(shortTime(window.end))});
            }
        }
    }

    std::stable_sort(events.begin(), events.end(), [](const ReminderEvent &lhs, const ReminderEvent &rhs) {
        return lhs.fireTime < rhs.fireTime;
    });
    return events;
}

std::vector<data::FastingWindow> collectReminderCandidates(const data::FastingWindowStore &store,
                                                           const std::vector<data::FastingWindow> &schedule,
                                                           const std::optional<data::FastingWindow> &active,
                                                           const QDateTime &reference,
                                                           int limit)
{
    QHash<QUuid, data::FastingWindow> candidates;
    if (active && active->type == data::WindowType::Fast) {
        candidates.insert(active->id, *active);
    }
    for (const auto &window : schedule) {
        if (window.type == data::WindowType::Fast) {
            candidates.insert(window.id, window);
        }
    }

    QDateTime cursor = reference;
    int attempts = 0;
    while (candidates.size() < limit && attempts < limit * 2) {
        const auto next = store.fetchNextWindow(cursor, data::WindowType::Fast);
        if (!next) {
            break;
        }
        if (!candidates.contains(next->id)) {
            candidates.insert(next->id, *next);
        }
        cursor = std::max(next->end, next->start).addSecs(1);
        ++attempts;
    }

    std::vector<data::FastingWindow> windows;
    windows.reserve(static_cast<size_t>(candidates.size()));
    for (const auto &window : candidates) {
        windows.push_back(window);
    }
    std::sort(windows.begin(), windows.end(), [](const data::FastingWindow &lhs, const data::FastingWindow &rhs) {
        return lhs.start < rhs.start;
    });
    return windows;
}

} // namespace notify
} // namespace fasting
