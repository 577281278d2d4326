#include "fasting/core/TimelineReconciler.hpp"

#include <algorithm>
#include <cstdlib>

#include "fasting/core/Logging.hpp"
#include "fasting/core/NotificationPreferences.hpp"
#include "fasting/data/DatabaseError.hpp"
#include "fasting/data/FastingWindowStore.hpp"
#include "fasting/notify/NotificationScheduler.hpp"
#include "fasting/notify/ReminderDeriver.hpp"

namespace fasting {
namespace core {

namespace {
struct BusyGuard
{
    explicit BusyGuard(bool &flag)
        : m_flag(flag)
    {
        m_flag = true;
    }
    ~BusyGuard() { m_flag = false; }

    bool &m_flag;
};

bool startsBefore(const data::FastingWindow &lhs, const data::FastingWindow &rhs)
{
    return lhs.start < rhs.start;
}

// Candidate whose start lies closest to the boundary; earlier wins a tie.
const data::FastingWindow *closestTo(const std::vector<data::FastingWindow> &windows, const QDateTime &boundary)
{
    const data::FastingWindow *best = nullptr;
    qint64 bestDistance = 0;
    for (const auto &window : windows) {
        const qint64 distance = std::abs(boundary.msecsTo(window.start));
        if (!best || distance < bestDistance) {
            best = &window;
            bestDistance = distance;
        }
    }
    return best;
}
} // namespace

TimelineReconciler::TimelineReconciler(data::FastingWindowStore &store,
                                       notify::NotificationScheduler &scheduler,
                                       NotificationPreferences &preferences,
                                       NowProvider now,
                                       QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_scheduler(scheduler)
    , m_preferences(preferences)
    , m_now(std::move(now))
{
}

TimelineReconciler::~TimelineReconciler() = default;

void TimelineReconciler::setTolerances(const ReconcilerTolerances &tolerances)
{
    m_tolerances = tolerances;
}

const ReconcilerTolerances &TimelineReconciler::tolerances() const
{
    return m_tolerances;
}

bool TimelineReconciler::startFast(const QDateTime &at)
{
    return run("startFast", [&]() -> QString {
        if (!at.isValid()) {
            return tr("A valid start time is required.");
        }

        const EffectiveDurations durations = loadDurations();
        const QDateTime expectedEnd = at.addSecs(durations.fastSecs);

        // A zero-length fast is never active, so look for one already started at the same instant.
        for (const auto &existing : windowsStartingIn(data::WindowType::Fast, at, at)) {
            if (existing.end >= expectedEnd) {
                spdlog::debug("Fast {} already starts at {}", logText(existing.id), logText(at));
                reload();
                return {};
            }
        }

        if (auto active = m_store.fetchActiveWindow(at)) {
            if (active->type == data::WindowType::Fast) {
                spdlog::debug("Fast {} already covers {}", logText(active->id), logText(at));
                reload();
                return {};
            }
            data::FastingWindow trimmed = *active;
            trimmed.end = std::max(at, trimmed.start);
            m_store.saveWindow(trimmed, data::WindowSource::User);
        } else if (auto recentEat = m_store.fetchMostRecentWindow(at, data::WindowType::Eat)) {
            if (recentEat->end > at) {
                recentEat->end = at;
                m_store.saveWindow(*recentEat, data::WindowSource::User);
            }
        }

        std::vector<data::FastingWindow> placeholders;
        for (const auto &window : windowsStartingIn(data::WindowType::Fast,
                                                    at.addSecs(-m_tolerances.placeholderLookbackSecs),
                                                    at.addSecs(m_tolerances.placeholderSecs))) {
            if (window.source == data::WindowSource::System) {
                placeholders.push_back(window);
            }
        }

        data::FastingWindow fast;
        if (const auto *placeholder = closestTo(placeholders, at)) {
            fast = *placeholder;
            spdlog::debug("Reusing placeholder fast {}", logText(fast.id));
        }
        fast.type = data::WindowType::Fast;
        fast.start = at;
        fast.end = expectedEnd;
        m_store.saveWindow(fast, data::WindowSource::User);

        if (durations.feedSecs > 0) {
            ensurePlannedEatingWindow(at, expectedEnd, durations.feedSecs);
        } else {
            for (const auto &eat : windowsStartingIn(data::WindowType::Eat, at,
                                                     expectedEnd.addSecs(m_tolerances.placeholderSecs))) {
                m_store.deleteWindow(eat.id);
            }
        }

        for (const auto &other : windowsStartingIn(data::WindowType::Fast, at, expectedEnd)) {
            if (other.id != fast.id && other.start < expectedEnd) {
                spdlog::debug("Removing overlapping fast {}", logText(other.id));
                m_store.deleteWindow(other.id);
            }
        }

        reload();
        return {};
    });
}

bool TimelineReconciler::stopFast(const QDateTime &at)
{
    return run("stopFast", [&]() -> QString {
        if (!at.isValid()) {
            return tr("A valid stop time is required.");
        }

        const EffectiveDurations durations = loadDurations();
        auto fast = resolveFastToStop(at);
        if (!fast) {
            return tr("There is no fast to stop.");
        }

        fast->end = std::max(at, fast->start);
        m_store.saveWindow(*fast, data::WindowSource::User);
        trimOverlappingFasts(at, fast->id, durations.fastSecs);
        finalizeEatingWindow(*fast, durations);

        m_activeWindow.reset();
        m_isFasting = false;
        reload();
        return {};
    });
}

bool TimelineReconciler::createWindow(data::WindowType type, const QDateTime &start, const QDateTime &end,
                                      const QString &note)
{
    return run("createWindow", [&]() -> QString {
        if (!start.isValid() || !end.isValid() || end < start) {
            return tr("The end of a window must not be before its start.");
        }
        data::FastingWindow window;
        window.type = type;
        window.start = start;
        window.end = end;
        window.note = note;
        m_store.saveWindow(window, data::WindowSource::User);
        reload();
        return {};
    });
}

bool TimelineReconciler::updateWindow(const data::FastingWindow &window)
{
    return run("updateWindow", [&]() -> QString {
        if (!window.start.isValid() || !window.end.isValid() || window.end < window.start) {
            return tr("The end of a window must not be before its start.");
        }
        m_store.saveWindow(window, data::WindowSource::User);
        reload();
        return {};
    });
}

bool TimelineReconciler::deleteWindow(const QUuid &id)
{
    return run("deleteWindow", [&]() -> QString {
        m_store.deleteWindow(id);
        reload();
        return {};
    });
}

std::optional<data::FastingWindow> TimelineReconciler::windowDetails(const QUuid &id)
{
    std::optional<data::FastingWindow> window;
    run("windowDetails", [&]() -> QString {
        window = m_store.fetchWindow(id);
        return {};
    });
    return window;
}

std::optional<QUuid> TimelineReconciler::saveRegimen(const std::optional<QUuid> &existingId,
                                                     const QString &name,
                                                     double fastHours,
                                                     double feedHours,
                                                     bool setActive)
{
    std::optional<QUuid> savedId;
    run("saveRegimen", [&]() -> QString {
        const QString trimmedName = name.trimmed();
        if (trimmedName.isEmpty()) {
            return tr("Please provide a name for the regimen.");
        }

        const QDateTime now = m_now();
        data::FastingRegimen regimen;
        regimen.createdAt = now;
        if (existingId) {
            regimen.id = *existingId;
            for (const auto &existing : m_store.fetchRegimens()) {
                if (existing.id == *existingId) {
                    regimen.createdAt = existing.createdAt;
                    regimen.isActive = existing.isActive;
                    break;
                }
            }
        }
        regimen.name = trimmedName;
        regimen.fastDuration = std::max<qint64>(qRound64(fastHours * 3600.0), 0);
        regimen.feedDuration = std::max<qint64>(qRound64(feedHours * 3600.0), 0);
        regimen.isActive = regimen.isActive || setActive;
        regimen.updatedAt = now;

        m_store.saveRegimen(regimen);
        savedId = regimen.id;
        reload();
        return {};
    });
    return savedId;
}

bool TimelineReconciler::activateRegimen(const QUuid &id)
{
    return run("activateRegimen", [&]() -> QString {
        m_store.setActiveRegimen(id);
        reload();
        return {};
    });
}

bool TimelineReconciler::deleteRegimen(const QUuid &id)
{
    return run("deleteRegimen", [&]() -> QString {
        m_store.deleteRegimen(id);
        reload();
        return {};
    });
}

std::vector<data::FastingRegimen> TimelineReconciler::regimens()
{
    std::vector<data::FastingRegimen> result;
    run("regimens", [&]() -> QString {
        result = m_store.fetchRegimens();
        return {};
    });
    return result;
}

std::optional<QByteArray> TimelineReconciler::exportDatabase()
{
    std::optional<QByteArray> snapshot;
    run("exportDatabase", [&]() -> QString {
        snapshot = m_store.exportSnapshot();
        return {};
    });
    return snapshot;
}

bool TimelineReconciler::importDatabase(const QString &sourcePath)
{
    return run("importDatabase", [&]() -> QString {
        m_store.importSnapshot(sourcePath);
        m_activeWindow.reset();
        reload();
        return {};
    });
}

bool TimelineReconciler::resetDatabase()
{
    return run("resetDatabase", [&]() -> QString {
        m_store.resetDatabase();
        m_activeWindow.reset();
        reload();
        return {};
    });
}

bool TimelineReconciler::setLeadTime(qint64 seconds)
{
    return run("setLeadTime", [&]() -> QString {
        m_preferences.setLeadTimeSecs(seconds);
        pushReminders();
        return {};
    });
}

qint64 TimelineReconciler::leadTime() const
{
    return m_preferences.leadTimeSecs();
}

bool TimelineReconciler::refreshState()
{
    return run("refreshState", [&]() -> QString {
        reload();
        return {};
    });
}

bool TimelineReconciler::syncReminders()
{
    return run("syncReminders", [&]() -> QString {
        pushReminders();
        return {};
    });
}

const std::vector<data::FastingWindow> &TimelineReconciler::todayWindows() const
{
    return m_todayWindows;
}

bool TimelineReconciler::showsPlannedDay() const
{
    return m_storedToday.empty();
}

const std::optional<data::FastingWindow> &TimelineReconciler::activeWindow() const
{
    return m_activeWindow;
}

bool TimelineReconciler::isFasting() const
{
    return m_isFasting;
}

const std::optional<data::FastingRegimen> &TimelineReconciler::activeRegimen() const
{
    return m_activeRegimen;
}

const std::optional<data::FastingWindow> &TimelineReconciler::lastFastWindow() const
{
    return m_lastFastWindow;
}

const std::vector<DaySummary> &TimelineReconciler::weeklySummary() const
{
    return m_weeklySummary;
}

const std::vector<HistorySection> &TimelineReconciler::recentHistory() const
{
    return m_recentHistory;
}

EffectiveDurations TimelineReconciler::durations() const
{
    return effectiveDurations(m_activeRegimen);
}

QString TimelineReconciler::lastError() const
{
    return m_lastError;
}

double TimelineReconciler::progress(const QDateTime &at) const
{
    if (!m_activeWindow) {
        return 0.0;
    }
    const qint64 total = m_activeWindow->start.msecsTo(m_activeWindow->end);
    if (total <= 0) {
        return 0.0;
    }
    const qint64 elapsed = std::clamp<qint64>(m_activeWindow->start.msecsTo(at), 0, total);
    return static_cast<double>(elapsed) / static_cast<double>(total);
}

qint64 TimelineReconciler::remainingSecs(const QDateTime &at) const
{
    if (!m_activeWindow) {
        return 0;
    }
    return std::max<qint64>(at.secsTo(m_activeWindow->end), 0);
}

bool TimelineReconciler::run(const char *operation, const std::function<QString()> &body)
{
    if (m_busy) {
        return fail(operation, tr("Another timeline operation is still running."));
    }

    QString failure;
    {
        BusyGuard guard(m_busy);
        try {
            failure = body();
        } catch (const data::DatabaseError &error) {
            failure = error.message();
        }
    }

    if (!failure.isEmpty()) {
        return fail(operation, failure);
    }
    m_lastError.clear();
    spdlog::debug("{} done", operation);
    return true;
}

bool TimelineReconciler::fail(const char *operation, const QString &message)
{
    spdlog::warn("{} failed: {}", operation, logText(message));
    m_lastError = message;
    emit errorOccurred(message);
    return false;
}

EffectiveDurations TimelineReconciler::loadDurations()
{
    m_activeRegimen = m_store.fetchActiveRegimen();
    return effectiveDurations(m_activeRegimen);
}

std::vector<data::FastingWindow> TimelineReconciler::windowsStartingIn(data::WindowType type,
                                                                       const QDateTime &from,
                                                                       const QDateTime &to) const
{
    // Every window starting in [from, to] intersects the slightly wider range.
    std::vector<data::FastingWindow> result;
    for (auto &window : m_store.fetchWindows(from.addMSecs(-1), to.addMSecs(1))) {
        if (window.type == type && window.start >= from && window.start <= to) {
            result.push_back(std::move(window));
        }
    }
    std::stable_sort(result.begin(), result.end(), startsBefore);
    return result;
}

std::optional<data::FastingWindow> TimelineReconciler::resolveFastToStop(const QDateTime &at) const
{
    if (m_activeWindow && m_activeWindow->type == data::WindowType::Fast) {
        auto cached = m_store.fetchWindow(m_activeWindow->id);
        if (cached && cached->type == data::WindowType::Fast) {
            return cached;
        }
    }
    auto active = m_store.fetchActiveWindow(at);
    if (active && active->type == data::WindowType::Fast) {
        return active;
    }
    return m_store.fetchMostRecentWindow(at, data::WindowType::Fast);
}

void TimelineReconciler::ensurePlannedEatingWindow(const QDateTime &fastStart,
                                                   const QDateTime &expectedEnd,
                                                   qint64 feedSecs)
{
    const auto candidates = windowsStartingIn(data::WindowType::Eat, fastStart,
                                              expectedEnd.addSecs(m_tolerances.placeholderSecs));

    data::FastingWindow eat;
    if (!candidates.empty()) {
        eat = candidates.front();
    }
    eat.type = data::WindowType::Eat;
    eat.start = expectedEnd;
    eat.end = expectedEnd.addSecs(feedSecs);
    m_store.saveWindow(eat, data::WindowSource::System);

    for (const auto &other : candidates) {
        if (other.id != eat.id) {
            m_store.deleteWindow(other.id);
        }
    }
}

void TimelineReconciler::finalizeEatingWindow(const data::FastingWindow &closedFast,
                                              const EffectiveDurations &durations)
{
    const QDateTime fastEnd = closedFast.end;

    if (durations.feedSecs <= 0) {
        const qint64 horizon = std::max(durations.fastSecs, m_tolerances.placeholderSecs);
        for (const auto &eat : windowsStartingIn(data::WindowType::Eat, closedFast.start, fastEnd.addSecs(horizon))) {
            m_store.deleteWindow(eat.id);
        }
        const auto upcoming = ensureUpcomingFast(fastEnd, durations.fastSecs, closedFast);
        if (upcoming) {
            discardStalePlaceholders(fastEnd, upcoming->end, {closedFast.id, upcoming->id});
        }
        return;
    }

    const auto candidates = windowsStartingIn(data::WindowType::Eat, closedFast.start,
                                              fastEnd.addSecs(m_tolerances.placeholderSecs));
    data::FastingWindow eat;
    if (!candidates.empty()) {
        eat = candidates.front();
    }
    eat.type = data::WindowType::Eat;
    eat.start = fastEnd;
    eat.end = fastEnd.addSecs(durations.feedSecs);
    m_store.saveWindow(eat, data::WindowSource::User);

    const auto upcoming = ensureUpcomingFast(eat.end, durations.fastSecs, closedFast);

    for (const auto &other : windowsStartingIn(data::WindowType::Eat, closedFast.start, eat.end)) {
        if (other.id != eat.id && other.start < eat.end) {
            spdlog::debug("Removing duplicate eating window {}", logText(other.id));
            m_store.deleteWindow(other.id);
        }
    }

    for (const auto &other : windowsStartingIn(data::WindowType::Fast, fastEnd, eat.end)) {
        if (other.id != closedFast.id && other.start < eat.end && (!upcoming || other.id != upcoming->id)) {
            spdlog::debug("Removing fast {} inside the eating window", logText(other.id));
            m_store.deleteWindow(other.id);
        }
    }

    std::vector<QUuid> keep{closedFast.id, eat.id};
    if (upcoming) {
        keep.push_back(upcoming->id);
    }
    discardStalePlaceholders(fastEnd, upcoming ? upcoming->end : eat.end, keep);
}

std::optional<data::FastingWindow> TimelineReconciler::ensureUpcomingFast(const QDateTime &start,
                                                                          qint64 fastSecs,
                                                                          const data::FastingWindow &closedFast)
{
    if (fastSecs <= 0) {
        return std::nullopt;
    }

    const QDateTime from = std::max(start.addSecs(-m_tolerances.placeholderLookbackSecs), closedFast.start.addMSecs(1));
    std::vector<data::FastingWindow> candidates;
    for (const auto &window : windowsStartingIn(data::WindowType::Fast, from,
                                                start.addSecs(m_tolerances.placeholderSecs))) {
        if (window.id != closedFast.id) {
            candidates.push_back(window);
        }
    }

    data::FastingWindow fast;
    fast.source = data::WindowSource::System;
    if (const auto *existing = closestTo(candidates, start)) {
        fast = *existing;
    }
    fast.type = data::WindowType::Fast;
    fast.start = start;
    fast.end = start.addSecs(fastSecs);
    m_store.saveWindow(fast, fast.source);
    return fast;
}

void TimelineReconciler::trimOverlappingFasts(const QDateTime &at, const QUuid &keep, qint64 fastSecs)
{
    const qint64 lookback = std::max<qint64>(fastSecs, 0) + m_tolerances.overlapLookbackMarginSecs;
    for (auto &fast : m_store.fetchWindows(at.addSecs(-lookback), at.addSecs(1))) {
        if (fast.type != data::WindowType::Fast || fast.id == keep || fast.end <= at) {
            continue;
        }
        if (fast.start < at) {
            fast.end = at;
            m_store.saveWindow(fast, data::WindowSource::User);
        } else {
            m_store.deleteWindow(fast.id);
        }
    }
}

void TimelineReconciler::discardStalePlaceholders(const QDateTime &from,
                                                  const QDateTime &to,
                                                  const std::vector<QUuid> &keep)
{
    if (to <= from) {
        return;
    }
    for (const auto &window : m_store.fetchWindows(from.addMSecs(-1), to)) {
        if (window.source != data::WindowSource::System || window.start < from || window.start >= to) {
            continue;
        }
        if (std::find(keep.begin(), keep.end(), window.id) != keep.end()) {
            continue;
        }
        spdlog::debug("Discarding stale placeholder {}", logText(window.id));
        m_store.deleteWindow(window.id);
    }
}

void TimelineReconciler::reload()
{
    const QDateTime now = m_now();
    const QDate today = now.date();

    m_activeRegimen = m_store.fetchActiveRegimen();
    const EffectiveDurations durations = effectiveDurations(m_activeRegimen);

    m_storedToday = m_store.fetchWindows(startOfDay(today), startOfDay(today.addDays(1)));
    m_todayWindows = m_storedToday.empty() ? defaultDailySchedule(now, durations) : m_storedToday;
    std::stable_sort(m_todayWindows.begin(), m_todayWindows.end(), startsBefore);

    m_activeWindow = m_store.fetchActiveWindow(now);
    m_isFasting = m_activeWindow && m_activeWindow->type == data::WindowType::Fast;
    m_lastFastWindow = m_store.fetchMostRecentWindow(now, data::WindowType::Fast);

    const QDate firstDay = weekStart(today);
    m_weeklySummary = makeWeekSummary(firstDay,
                                      m_store.fetchWindows(startOfDay(firstDay), startOfDay(firstDay.addDays(7))),
                                      durations);
    m_recentHistory = makeHistory(m_store.fetchWindows(startOfDay(today.addDays(-(HistoryDays - 1))),
                                                       startOfDay(today.addDays(1))));

    emit stateChanged();
    pushReminders();
}

void TimelineReconciler::pushReminders()
{
    const QDateTime now = m_now();
    const auto candidates = notify::collectReminderCandidates(m_store, m_storedToday, m_activeWindow, now);
    m_scheduler.updateNotifications(candidates, m_preferences.leadTimeSecs(), now);
}

} // namespace core
} // namespace fasting
