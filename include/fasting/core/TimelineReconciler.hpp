#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <QByteArray>
#include <QObject>
#include <QString>

#include "fasting/core/Clock.hpp"
#include "fasting/core/Durations.hpp"
#include "fasting/core/ScheduleProjections.hpp"
#include "fasting/data/FastingRegimen.hpp"
#include "fasting/data/FastingWindow.hpp"

namespace fasting {
namespace data {
class FastingWindowStore;
}
namespace notify {
class NotificationScheduler;
}

namespace core {

class NotificationPreferences;

struct ReconcilerTolerances
{
    // A placeholder starting at most this long after the boundary is reused.
    qint64 placeholderSecs = 10 * 60;
    // How far before the boundary a placeholder may start and still be reused.
    qint64 placeholderLookbackSecs = 60 * 60;
    // Added to the fast duration when looking for fasts overlapping a stop.
    qint64 overlapLookbackMarginSecs = 60 * 60;
};

// Applies start/stop/edit and regimen actions to the window timeline and keeps
// the derived schedule state (today, active window, summaries, reminders)
// current. Operations report failure through their return value, lastError()
// and errorOccurred(); they must not be interleaved.
class TimelineReconciler : public QObject
{
    Q_OBJECT

public:
    TimelineReconciler(data::FastingWindowStore &store,
                       notify::NotificationScheduler &scheduler,
                       NotificationPreferences &preferences,
                       NowProvider now = systemClock(),
                       QObject *parent = nullptr);
    ~TimelineReconciler() override;

    void setTolerances(const ReconcilerTolerances &tolerances);
    const ReconcilerTolerances &tolerances() const;

    bool startFast(const QDateTime &at);
    bool stopFast(const QDateTime &at);

    bool createWindow(data::WindowType type, const QDateTime &start, const QDateTime &end,
                      const QString &note = QString());
    bool updateWindow(const data::FastingWindow &window);
    bool deleteWindow(const QUuid &id);
    std::optional<data::FastingWindow> windowDetails(const QUuid &id);

    std::optional<QUuid> saveRegimen(const std::optional<QUuid> &existingId,
                                     const QString &name,
                                     double fastHours,
                                     double feedHours,
                                     bool setActive);
    bool activateRegimen(const QUuid &id);
    bool deleteRegimen(const QUuid &id);
    std::vector<data::FastingRegimen> regimens();

    std::optional<QByteArray> exportDatabase();
    bool importDatabase(const QString &sourcePath);
    bool resetDatabase();

    bool setLeadTime(qint64 seconds);
    qint64 leadTime() const;

    bool refreshState();
    bool syncReminders();

    const std::vector<data::FastingWindow> &todayWindows() const;
    // True when todayWindows() holds the planned default day instead of stored windows.
    bool showsPlannedDay() const;
    const std::optional<data::FastingWindow> &activeWindow() const;
    bool isFasting() const;
    const std::optional<data::FastingRegimen> &activeRegimen() const;
    const std::optional<data::FastingWindow> &lastFastWindow() const;
    const std::vector<DaySummary> &weeklySummary() const;
    const std::vector<HistorySection> &recentHistory() const;
    EffectiveDurations durations() const;
    QString lastError() const;

    double progress(const QDateTime &at) const;
    qint64 remainingSecs(const QDateTime &at) const;

signals:
    void stateChanged();
    void errorOccurred(const QString &message);

private:
    // body returns a failure message, or an empty string on success.
    bool run(const char *operation, const std::function<QString()> &body);
    bool fail(const char *operation, const QString &message);

    EffectiveDurations loadDurations();
    std::vector<data::FastingWindow> windowsStartingIn(data::WindowType type,
                                                       const QDateTime &from,
                                                       const QDateTime &to) const;
    std::optional<data::FastingWindow> resolveFastToStop(const QDateTime &at) const;

    void ensurePlannedEatingWindow(const QDateTime &fastStart, const QDateTime &expectedEnd, qint64 feedSecs);
    void finalizeEatingWindow(const data::FastingWindow &closedFast, const EffectiveDurations &durations);
    std::optional<data::FastingWindow> ensureUpcomingFast(const QDateTime &start,
                                                          qint64 fastSecs,
                                                          const data::FastingWindow &closedFast);
    void trimOverlappingFasts(const QDateTime &at, const QUuid &keep, qint64 fastSecs);
    void discardStalePlaceholders(const QDateTime &from, const QDateTime &to, const std::vector<QUuid> &keep);

    void reload();
    void pushReminders();

    data::FastingWindowStore &m_store;
    notify::NotificationScheduler &m_scheduler;
    NotificationPreferences &m_preferences;
    NowProvider m_now;
    ReconcilerTolerances m_tolerances;
    bool m_busy = false;

    std::vector<data::FastingWindow> m_todayWindows;
    std::vector<data::FastingWindow> m_storedToday;
    std::optional<data::FastingWindow> m_activeWindow;
    bool m_isFasting = false;
    std::optional<data::FastingRegimen> m_activeRegimen;
    std::optional<data::FastingWindow> m_lastFastWindow;
    std::vector<DaySummary> m_weeklySummary;
    std::vector<HistorySection> m_recentHistory;
    QString m_lastError;
};

} // namespace core
} // namespace fasting
