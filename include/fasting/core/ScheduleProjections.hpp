#pragma once

#include <vector>

#include <QDate>
#include <QLocale>
#include <QString>

#include "fasting/core/Durations.hpp"
#include "fasting/data/FastingWindow.hpp"

namespace fasting {
namespace core {

constexpr int HistoryDays = 7;

struct DaySummary
{
    QDate date;
    QString weekday;
    QString target;
    double achieved = 0.0;
};

struct HistoryEntry
{
    QUuid windowId;
    data::WindowType type = data::WindowType::Fast;
    QDateTime start;
    QDateTime end;

    qint64 durationSecs() const;
};

struct HistorySection
{
    QDate date;
    QString title;
    std::vector<HistoryEntry> entries;
};

QDateTime startOfDay(const QDate &date);

// First day of the locale's week containing anchor.
QDate weekStart(const QDate &anchor, const QLocale &locale = QLocale());

// "16h · 8h", or only the fasting part when there is no feeding window.
QString regimenTargetLabel(qint64 fastSecs, qint64 feedSecs);

// One entry per day of the week beginning at firstDay. achieved is the share
// of the fasting target covered by fast windows on that day, clamped to [0, 1].
std::vector<DaySummary> makeWeekSummary(const QDate &firstDay,
                                        const std::vector<data::FastingWindow> &windows,
                                        const EffectiveDurations &durations,
                                        const QLocale &locale = QLocale());

// Windows grouped by the local day of their start, newest day first and
// entries within a day oldest first.
std::vector<HistorySection> makeHistory(const std::vector<data::FastingWindow> &windows,
                                        const QLocale &locale = QLocale());

// Planned day shown when nothing is stored for it: a fast ending at noon
// followed by the feeding window. Never persisted.
std::vector<data::FastingWindow> defaultDailySchedule(const QDateTime &anchor, const EffectiveDurations &durations);

} // namespace core
} // namespace fasting
