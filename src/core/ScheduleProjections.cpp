#include "fasting/core/ScheduleProjections.hpp"

#include <QMap>
#include <algorithm>

namespace fasting {
namespace core {

namespace {
QString hoursLabel(qint64 seconds)
{
    return QStringLiteral("%1h").arg(std::max<qint64>(seconds, 0) / 3600);
}
} // namespace

qint64 HistoryEntry::durationSecs() const
{
    return std::max<qint64>(start.secsTo(end), 0);
}

QDateTime startOfDay(const QDate &date)
{
    return QDateTime(date, QTime(0, 0));
}

QDate weekStart(const QDate &anchor, const QLocale &locale)
{
    const int first = static_cast<int>(locale.firstDayOfWeek());
    const int offset = (anchor.dayOfWeek() - first + 7) % 7;
    return anchor.addDays(-offset);
}

QString regimenTargetLabel(qint64 fastSecs, qint64 feedSecs)
{
    if (feedSecs <= 0) {
        return hoursLabel(fastSecs);
    }
    return QStringLiteral("%1 · %2").arg(hoursLabel(fastSecs), hoursLabel(feedSecs));
}

std::vector<DaySummary> makeWeekSummary(const QDate &firstDay,
                                        const std::vector<data::FastingWindow> &windows,
                                        const EffectiveDurations &durations,
                                        const QLocale &locale)
{
    const qint64 targetSecs = durations.fastSecs > 0 ? durations.fastSecs : data::DefaultFastDurationSecs;
    const QString target = regimenTargetLabel(durations.fastSecs, durations.feedSecs);

    std::vector<DaySummary> days;
    days.reserve(7);
    for (int i = 0; i < 7; ++i) {
        const QDate date = firstDay.addDays(i);
        const QDateTime from = startOfDay(date);
        const QDateTime to = startOfDay(date.addDays(1));

        qint64 totalMSecs = 0;
        for (const auto &window : windows) {
            if (window.type == data::WindowType::Fast) {
                totalMSecs += window.overlapMSecs(from, to);
            }
        }

        DaySummary day;
        day.date = date;
        day.weekday = locale.standaloneDayName(date.dayOfWeek(), QLocale::ShortFormat);
        day.target = target;
        day.achieved = std::clamp(static_cast<double>(totalMSecs) / (static_cast<double>(targetSecs) * 1000.0), 0.0, 1.0);
        days.push_back(day);
    }
    return days;
}

std::vector<HistorySection> makeHistory(const std::vector<data::FastingWindow> &windows, const QLocale &locale)
{
    QMap<QDate, std::vector<HistoryEntry>> grouped;
    for (const auto &window : windows) {
        grouped[window.start.date()].push_back({window.id, window.type, window.start, window.end});
    }

    std::vector<HistorySection> sections;
    sections.reserve(static_cast<size_t>(grouped.size()));
    for (auto it = grouped.cend(); it != grouped.cbegin();) {
        --it;
        HistorySection section;
        section.date = it.key();
        section.title = locale.toString(it.key(), QLocale::ShortFormat);
        section.entries = it.value();
        std::stable_sort(section.entries.begin(), section.entries.end(),
                         [](const HistoryEntry &lhs, const HistoryEntry &rhs) { return lhs.start < rhs.start; });
        sections.push_back(std::move(section));
    }
    return sections;
}

std::vector<data::FastingWindow> defaultDailySchedule(const QDateTime &anchor, const EffectiveDurations &durations)
{
    const QDateTime fastEnd(anchor.date(), QTime(12, 0));
    const qint64 fastSecs = std::max<qint64>(durations.fastSecs, 0);
    const qint64 feedSecs = std::max<qint64>(durations.feedSecs, 0);

    std::vector<data::FastingWindow> windows;

    data::FastingWindow fast;
    fast.type = data::WindowType::Fast;
    fast.start = fastEnd.addSecs(-fastSecs);
    fast.end = fastEnd;
    fast.source = data::WindowSource::System;
    windows.push_back(fast);

    if (feedSecs > 0) {
        data::FastingWindow eat;
        eat.type = data::WindowType::Eat;
        eat.start = fastEnd;
        eat.end = fastEnd.addSecs(feedSecs);
        eat.source = data::WindowSource::System;
        windows.push_back(eat);
    }
    return windows;
}

} // namespace core
} // namespace fasting
