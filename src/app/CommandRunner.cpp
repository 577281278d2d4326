#include "fasting/app/CommandRunner.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSaveFile>
#include <QTimer>
#include <QUuid>
#include <algorithm>
#include <optional>

#include "fasting/core/AppContext.hpp"
#include "fasting/core/Logging.hpp"
#include "fasting/core/ScheduleProjections.hpp"
#include "fasting/core/TimelineReconciler.hpp"
#include "fasting/data/DatabaseError.hpp"
#include "fasting/data/FastingWindowStore.hpp"
#include "fasting/notify/NotificationScheduler.hpp"
#include "fasting/notify/TimerNotificationCenter.hpp"

namespace fasting {
namespace app {

namespace {
const QString DatabaseOption = QStringLiteral("database");
const QString AtOption = QStringLiteral("at");
const QString DateOption = QStringLiteral("date");
const QString NoteOption = QStringLiteral("note");
const QString IdOption = QStringLiteral("id");
const QString ActivateOption = QStringLiteral("activate");
const QString LogLevelOption = QStringLiteral("log-level");

constexpr int WatchRefreshIntervalMs = 60 * 1000;

QString formatTime(const QDateTime &instant)
{
    return instant.toString(Qt::ISODate);
}

QString formatDuration(qint64 seconds)
{
    const qint64 clamped = std::max<qint64>(seconds, 0);
    return QStringLiteral("%1h %2m").arg(clamped / 3600).arg((clamped % 3600) / 60, 2, 10, QLatin1Char('0'));
}

std::optional<QDateTime> parseTimestamp(const QString &value)
{
    QDateTime parsed = QDateTime::fromString(value, Qt::ISODate);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value, QStringLiteral("yyyy-MM-dd HH:mm"));
    }
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<QUuid> parseUuid(const QString &value)
{
    const QUuid id(value);
    if (id.isNull()) {
        return std::nullopt;
    }
    return id;
}
} // namespace

void addCommandLineOptions(QCommandLineParser &parser)
{
    parser.setApplicationDescription(QCoreApplication::translate(
        "fastingctl",
        "Tracks fasting and eating windows.\n\n"
        "Commands:\n"
        "  status                                 Current window, progress and regimen\n"
        "  start [--at TIME]                      Start a fast\n"
        "  stop [--at TIME]                       Stop the current or most recent fast\n"
        "  windows [--date DATE]                  Windows of today or the given day\n"
        "  create TYPE START END [--note TEXT]    Add a fast or eat window\n"
        "  edit ID TYPE START END [--note TEXT]   Change a window\n"
        "  delete ID                              Remove a window\n"
        "  regimens                               List regimens\n"
        "  regimen-save NAME FAST_H FEED_H [--id ID] [--activate]\n"
        "  regimen-activate ID\n"
        "  regimen-delete ID\n"
        "  summary                                Fasting achieved this week\n"
        "  history                                Windows of the last 7 days\n"
        "  export FILE | import FILE | reset      Database management\n"
        "  lead-time [MINUTES]                    Show or set the reminder lead time\n"
        "  watch                                  Deliver reminders until interrupted"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QCoreApplication::translate("fastingctl", "Command to run."));
    parser.addOptions({
        {DatabaseOption, QCoreApplication::translate("fastingctl", "Database file to use."),
         QStringLiteral("path")},
        {AtOption, QCoreApplication::translate("fastingctl", "Time of a start or stop (ISO 8601)."),
         QStringLiteral("time")},
        {DateOption, QCoreApplication::translate("fastingctl", "Day to list (yyyy-MM-dd)."),
         QStringLiteral("date")},
        {NoteOption, QCoreApplication::translate("fastingctl", "Note attached to a window."),
         QStringLiteral("text")},
        {IdOption, QCoreApplication::translate("fastingctl", "Regimen to update."), QStringLiteral("id")},
        {ActivateOption, QCoreApplication::translate("fastingctl", "Make the saved regimen active.")},
        {LogLevelOption,
         QCoreApplication::translate("fastingctl", "Log level: trace, debug, info, warn, error or off."),
         QStringLiteral("level"), QStringLiteral("warn")},
    });
}

CommandRunner::CommandRunner(core::AppContext &context, QTextStream &out, QTextStream &err, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_out(out)
    , m_err(err)
{
}

int CommandRunner::execute(const QCommandLineParser &parser)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(tr("No command given."));
    }
    const QString command = positional.first();
    const QStringList args = positional.mid(1);
    spdlog::debug("Running {} {}", core::logText(command), core::logText(args.join(QLatin1Char(' '))));

    try {
        if (command == QLatin1String("status")) {
            return status();
        }
        if (command == QLatin1String("start")) {
            return startFast(parser);
        }
        if (command == QLatin1String("stop")) {
            return stopFast(parser);
        }
        if (command == QLatin1String("windows")) {
            return listWindows(parser);
        }
        if (command == QLatin1String("create")) {
            return createWindow(args, parser);
        }
        if (command == QLatin1String("edit")) {
            return editWindow(args, parser);
        }
        if (command == QLatin1String("delete")) {
            return deleteWindow(args);
        }
        if (command == QLatin1String("regimens")) {
            return listRegimens();
        }
        if (command == QLatin1String("regimen-save")) {
            return saveRegimen(args, parser);
        }
        if (command == QLatin1String("regimen-activate")) {
            return activateRegimen(args);
        }
        if (command == QLatin1String("regimen-delete")) {
            return deleteRegimen(args);
        }
        if (command == QLatin1String("summary")) {
            return summary();
        }
        if (command == QLatin1String("history")) {
            return history();
        }
        if (command == QLatin1String("export")) {
            return exportDatabase(args);
        }
        if (command == QLatin1String("import")) {
            return importDatabase(args);
        }
        if (command == QLatin1String("reset")) {
            return resetDatabase();
        }
        if (command == QLatin1String("lead-time")) {
            return leadTime(args);
        }
        if (command == QLatin1String("watch")) {
            return watch();
        }
    } catch (const data::DatabaseError &error) {
        m_err << tr("Database error: %1").arg(error.message()) << '\n';
        return ExitFailed;
    }
    return usage(tr("Unknown command '%1'.").arg(command));
}

int CommandRunner::status()
{
    auto &timeline = m_context.timeline();
    if (!timeline.refreshState()) {
        return reportFailure();
    }

    const QDateTime now = QDateTime::currentDateTime();
    if (const auto &regimen = timeline.activeRegimen()) {
        m_out << tr("Regimen: %1 (%2)")
                     .arg(regimen->name,
                          core::regimenTargetLabel(regimen->fastDuration, regimen->feedDuration))
              << '\n';
    }

    if (const auto &active = timeline.activeWindow()) {
        m_out << (timeline.isFasting() ? tr("You're fasting") : tr("Feeding window")) << '\n';
        m_out << tr("Window: %1 - %2").arg(formatTime(active->start), formatTime(active->end)) << '\n';
        m_out << tr("Progress: %1%").arg(qRound(timeline.progress(now) * 100.0)) << '\n';
        m_out << tr("Remaining: %1").arg(formatDuration(timeline.remainingSecs(now))) << '\n';
    } else {
        m_out << tr("No session in progress") << '\n';
    }

    if (const auto &lastFast = timeline.lastFastWindow()) {
        m_out << tr("Last fast: %1 - %2").arg(formatTime(lastFast->start), formatTime(lastFast->end)) << '\n';
    }
    m_out << tr("Reminder lead time: %1 min").arg(timeline.leadTime() / 60) << '\n';
    return ExitOk;
}

int CommandRunner::startFast(const QCommandLineParser &parser)
{
    QDateTime at = QDateTime::currentDateTime();
    if (parser.isSet(AtOption)) {
        const auto parsed = parseTimestamp(parser.value(AtOption));
        if (!parsed) {
            return usage(tr("Invalid time '%1'.").arg(parser.value(AtOption)));
        }
        at = *parsed;
    }

    auto &timeline = m_context.timeline();
    if (!timeline.startFast(at)) {
        return reportFailure();
    }
    m_out << tr("Fast started at %1").arg(formatTime(at)) << '\n';
    return ExitOk;
}

int CommandRunner::stopFast(const QCommandLineParser &parser)
{
    QDateTime at = QDateTime::currentDateTime();
    if (parser.isSet(AtOption)) {
        const auto parsed = parseTimestamp(parser.value(AtOption));
        if (!parsed) {
            return usage(tr("Invalid time '%1'.").arg(parser.value(AtOption)));
        }
        at = *parsed;
    }

    auto &timeline = m_context.timeline();
    if (!timeline.refreshState() || !timeline.stopFast(at)) {
        return reportFailure();
    }
    m_out << tr("Fast stopped at %1").arg(formatTime(at)) << '\n';
    return ExitOk;
}

int CommandRunner::listWindows(const QCommandLineParser &parser)
{
    if (parser.isSet(DateOption)) {
        const QDate date = QDate::fromString(parser.value(DateOption), Qt::ISODate);
        if (!date.isValid()) {
            return usage(tr("Invalid date '%1'.").arg(parser.value(DateOption)));
        }
        const auto windows = m_context.store().fetchWindows(core::startOfDay(date), core::startOfDay(date.addDays(1)));
        if (windows.empty()) {
            m_out << tr("No windows on %1").arg(date.toString(Qt::ISODate)) << '\n';
        }
        for (const auto &window : windows) {
            printWindow(window);
        }
        return ExitOk;
    }

    auto &timeline = m_context.timeline();
    if (!timeline.refreshState()) {
        return reportFailure();
    }
    const QString marker = timeline.showsPlannedDay() ? tr("planned") : QString();
    for (const auto &window : timeline.todayWindows()) {
        printWindow(window, marker);
    }
    return ExitOk;
}

int CommandRunner::createWindow(const QStringList &args, const QCommandLineParser &parser)
{
    if (args.size() != 3) {
        return usage(tr("create expects TYPE START END."));
    }
    const auto type = data::windowTypeFromString(args.at(0));
    const auto start = parseTimestamp(args.at(1));
    const auto end = parseTimestamp(args.at(2));
    if (!type || !start || !end) {
        return usage(tr("create expects a type of fast or eat and two ISO 8601 times."));
    }

    auto &timeline = m_context.timeline();
    if (!timeline.createWindow(*type, *start, *end, parser.value(NoteOption))) {
        return reportFailure();
    }
    m_out << tr("Window created") << '\n';
    return ExitOk;
}

int CommandRunner::editWindow(const QStringList &args, const QCommandLineParser &parser)
{
    if (args.size() != 4) {
        return usage(tr("edit expects ID TYPE START END."));
    }
    const auto id = parseUuid(args.at(0));
    const auto type = data::windowTypeFromString(args.at(1));
    const auto start = parseTimestamp(args.at(2));
    const auto end = parseTimestamp(args.at(3));
    if (!id || !type || !start || !end) {
        return usage(tr("edit expects a window id, a type of fast or eat and two ISO 8601 times."));
    }

    auto &timeline = m_context.timeline();
    auto window = timeline.windowDetails(*id);
    if (!window) {
        if (!timeline.lastError().isEmpty()) {
            return reportFailure();
        }
        m_err << tr("No window with id %1.").arg(args.at(0)) << '\n';
        return ExitFailed;
    }

    window->type = *type;
    window->start = *start;
    window->end = *end;
    if (parser.isSet(NoteOption)) {
        window->note = parser.value(NoteOption);
    }
    if (!timeline.updateWindow(*window)) {
        return reportFailure();
    }
    m_out << tr("Window updated") << '\n';
    return ExitOk;
}

int CommandRunner::deleteWindow(const QStringList &args)
{
    const auto id = args.size() == 1 ? parseUuid(args.at(0)) : std::nullopt;
    if (!id) {
        return usage(tr("delete expects a window id."));
    }
    if (!m_context.timeline().deleteWindow(*id)) {
        return reportFailure();
    }
    m_out << tr("Window deleted") << '\n';
    return ExitOk;
}

int CommandRunner::listRegimens()
{
    auto &timeline = m_context.timeline();
    const auto regimens = timeline.regimens();
    if (regimens.empty() && !timeline.lastError().isEmpty()) {
        return reportFailure();
    }
    for (const auto &regimen : regimens) {
        m_out << (regimen.isActive ? QStringLiteral("* ") : QStringLiteral("  ")) << regimen.name << "  "
              << core::regimenTargetLabel(regimen.fastDuration, regimen.feedDuration) << "  "
              << regimen.id.toString(QUuid::WithoutBraces) << '\n';
    }
    return ExitOk;
}

int CommandRunner::saveRegimen(const QStringList &args, const QCommandLineParser &parser)
{
    if (args.size() != 3) {
        return usage(tr("regimen-save expects NAME FAST_HOURS FEED_HOURS."));
    }
    bool fastOk = false;
    bool feedOk = false;
    const double fastHours = args.at(1).toDouble(&fastOk);
    const double feedHours = args.at(2).toDouble(&feedOk);
    if (!fastOk || !feedOk) {
        return usage(tr("Durations must be numbers of hours."));
    }

    std::optional<QUuid> existingId;
    if (parser.isSet(IdOption)) {
        existingId = parseUuid(parser.value(IdOption));
        if (!existingId) {
            return usage(tr("Invalid regimen id '%1'.").arg(parser.value(IdOption)));
        }
    }

    auto &timeline = m_context.timeline();
    const auto savedId = timeline.saveRegimen(existingId, args.at(0), fastHours, feedHours, parser.isSet(ActivateOption));
    if (!savedId) {
        return reportFailure();
    }
    m_out << tr("Regimen saved: %1").arg(savedId->toString(QUuid::WithoutBraces)) << '\n';
    return ExitOk;
}

int CommandRunner::activateRegimen(const QStringList &args)
{
    const auto id = args.size() == 1 ? parseUuid(args.at(0)) : std::nullopt;
    if (!id) {
        return usage(tr("regimen-activate expects a regimen id."));
    }
    if (!m_context.timeline().activateRegimen(*id)) {
        return reportFailure();
    }
    m_out << tr("Regimen activated") << '\n';
    return ExitOk;
}

int CommandRunner::deleteRegimen(const QStringList &args)
{
    const auto id = args.size() == 1 ? parseUuid(args.at(0)) : std::nullopt;
    if (!id) {
        return usage(tr("regimen-delete expects a regimen id."));
    }
    if (!m_context.timeline().deleteRegimen(*id)) {
        return reportFailure();
    }
    m_out << tr("Regimen deleted") << '\n';
    return ExitOk;
}

int CommandRunner::summary()
{
    auto &timeline = m_context.timeline();
    if (!timeline.refreshState()) {
        return reportFailure();
    }
    for (const auto &day : timeline.weeklySummary()) {
        m_out << day.weekday << ' ' << day.date.toString(Qt::ISODate) << "  " << day.target << "  "
              << qRound(day.achieved * 100.0) << "%\n";
    }
    return ExitOk;
}

int CommandRunner::history()
{
    auto &timeline = m_context.timeline();
    if (!timeline.refreshState()) {
        return reportFailure();
    }
    if (timeline.recentHistory().empty()) {
        m_out << tr("No windows in the last %1 days").arg(core::HistoryDays) << '\n';
    }
    for (const auto &section : timeline.recentHistory()) {
        m_out << section.title << '\n';
        for (const auto &entry : section.entries) {
            m_out << "  " << (entry.type == data::WindowType::Fast ? tr("Fasting Window") : tr("Eating Window"))
                  << "  " << entry.start.time().toString(QStringLiteral("HH:mm")) << " - "
                  << entry.end.time().toString(QStringLiteral("HH:mm")) << "  "
                  << formatDuration(entry.durationSecs()) << '\n';
        }
    }
    return ExitOk;
}

int CommandRunner::exportDatabase(const QStringList &args)
{
    if (args.size() != 1) {
        return usage(tr("export expects a target file."));
    }
    const auto snapshot = m_context.timeline().exportDatabase();
    if (!snapshot) {
        return reportFailure();
    }

    QSaveFile file(args.at(0));
    if (!file.open(QIODevice::WriteOnly)) {
        m_err << tr("Unable to write %1: %2").arg(args.at(0), file.errorString()) << '\n';
        return ExitFailed;
    }
    file.write(*snapshot);
    if (!file.commit()) {
        m_err << tr("Unable to write %1: %2").arg(args.at(0), file.errorString()) << '\n';
        return ExitFailed;
    }
    m_out << tr("Exported %1 bytes to %2").arg(snapshot->size()).arg(args.at(0)) << '\n';
    return ExitOk;
}

int CommandRunner::importDatabase(const QStringList &args)
{
    if (args.size() != 1) {
        return usage(tr("import expects a source file."));
    }
    if (!m_context.timeline().importDatabase(args.at(0))) {
        return reportFailure();
    }
    m_out << tr("Imported %1").arg(args.at(0)) << '\n';
    return ExitOk;
}

int CommandRunner::resetDatabase()
{
    if (!m_context.timeline().resetDatabase()) {
        return reportFailure();
    }
    m_out << tr("Database reset") << '\n';
    return ExitOk;
}

int CommandRunner::leadTime(const QStringList &args)
{
    auto &timeline = m_context.timeline();
    if (args.isEmpty()) {
        m_out << tr("Reminder lead time: %1 min").arg(timeline.leadTime() / 60) << '\n';
        return ExitOk;
    }

    bool ok = false;
    const qint64 minutes = args.first().toLongLong(&ok);
    if (args.size() != 1 || !ok || minutes < 0) {
        return usage(tr("lead-time expects a non-negative number of minutes."));
    }
    if (!timeline.setLeadTime(minutes * 60)) {
        return reportFailure();
    }
    m_out << tr("Reminder lead time: %1 min").arg(timeline.leadTime() / 60) << '\n';
    return ExitOk;
}

int CommandRunner::watch()
{
    auto &center = m_context.notificationCenter();
    auto &timeline = m_context.timeline();
    connect(&center, &notify::TimerNotificationCenter::delivered, this, &CommandRunner::printReminder);

    if (!m_context.notificationScheduler().requestAuthorizationIfNeeded()) {
        m_err << tr("Notifications are not authorized.") << '\n';
        return ExitFailed;
    }
    if (!timeline.refreshState()) {
        return reportFailure();
    }

    m_refreshTimer = new QTimer(this);
    connect(m_refreshTimer, &QTimer::timeout, &timeline, &core::TimelineReconciler::refreshState);
    m_refreshTimer->start(WatchRefreshIntervalMs);
    center.start();

    const auto pending = center.pendingRequests();
    m_out << tr("Watching %1 pending reminders. Press Ctrl+C to stop.").arg(pending.size()) << '\n';
    for (const auto &event : pending) {
        m_out << "  " << formatTime(event.fireTime) << "  " << event.title << '\n';
    }
    m_out.flush();
    return ExitRunning;
}

void CommandRunner::printReminder(const notify::ReminderEvent &event)
{
    m_out << formatTime(event.fireTime) << "  " << event.title << ": " << event.body << '\n';
    m_out.flush();
}

int CommandRunner::usage(const QString &message)
{
    m_err << message << '\n' << tr("Run with --help for usage.") << '\n';
    return ExitUsage;
}

int CommandRunner::reportFailure()
{
    m_err << m_context.timeline().lastError() << '\n';
    return ExitFailed;
}

void CommandRunner::printWindow(const data::FastingWindow &window, const QString &marker)
{
    m_out << window.id.toString(QUuid::WithoutBraces) << "  " << data::windowTypeToString(window.type) << "  "
          << formatTime(window.start) << " - " << formatTime(window.end) << "  "
          << formatDuration(window.durationSecs()) << "  "
          << (marker.isEmpty() ? data::windowSourceToString(window.source) : marker);
    if (!window.note.isEmpty()) {
        m_out << "  " << window.note;
    }
    m_out << '\n';
}

} // namespace app
} // namespace fasting
