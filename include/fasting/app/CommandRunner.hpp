#pragma once

#include <QObject>
#include <QStringList>
#include <QTextStream>

#include "fasting/notify/ReminderEvent.hpp"

class QCommandLineParser;
class QTimer;

namespace fasting {
namespace data {
struct FastingWindow;
}
namespace core {
class AppContext;
}

namespace app {

constexpr int ExitOk = 0;
constexpr int ExitFailed = 1;
constexpr int ExitUsage = 2;
// Returned by execute() when the command keeps the event loop running.
constexpr int ExitRunning = -1;

// Registers the global and per-command options understood by fastingctl.
void addCommandLineOptions(QCommandLineParser &parser);

class CommandRunner : public QObject
{
    Q_OBJECT

public:
    CommandRunner(core::AppContext &context, QTextStream &out, QTextStream &err, QObject *parent = nullptr);

    int execute(const QCommandLineParser &parser);

private slots:
    void printReminder(const fasting::notify::ReminderEvent &event);

private:
    int status();
    int startFast(const QCommandLineParser &parser);
    int stopFast(const QCommandLineParser &parser);
    int listWindows(const QCommandLineParser &parser);
    int createWindow(const QStringList &args, const QCommandLineParser &parser);
    int editWindow(const QStringList &args, const QCommandLineParser &parser);
    int deleteWindow(const QStringList &args);
    int listRegimens();
    int saveRegimen(const QStringList &args, const QCommandLineParser &parser);
    int activateRegimen(const QStringList &args);
    int deleteRegimen(const QStringList &args);
    int summary();
    int history();
    int exportDatabase(const QStringList &args);
    int importDatabase(const QStringList &args);
    int resetDatabase();
    int leadTime(const QStringList &args);
    int watch();

    int usage(const QString &message);
    int reportFailure();
    void printWindow(const data::FastingWindow &window, const QString &marker = QString());

    core::AppContext &m_context;
    QTextStream &m_out;
    QTextStream &m_err;
    QTimer *m_refreshTimer = nullptr;
};

} // namespace app
} // namespace fasting
