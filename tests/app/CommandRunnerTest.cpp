#include <QtTest/QtTest>

#include <QCommandLineParser>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <memory>

#include "fasting/app/CommandRunner.hpp"
#include "fasting/core/AppContext.hpp"

using namespace fasting;

class CommandRunnerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void missingCommandIsUsageError();
    void unknownCommandIsUsageError();
    void invalidTimeIsUsageError();
    void stopWithoutFastFails();
    void startAndStopFast();
    void createRejectsEndBeforeStart();
    void regimenAndLeadTime();
    void exportWritesSnapshot();
    void importOfMissingFileFails();

private:
    int run(const QStringList &arguments);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<core::AppContext> m_context;
    QString m_out;
    QString m_err;
};

void CommandRunnerTest::initTestCase()
{
    // Keeps the default QSettings away from the user's configuration.
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName(QStringLiteral("Fasting Tracker Tests"));
    QCoreApplication::setApplicationName(QStringLiteral("CommandRunnerTest"));
}

void CommandRunnerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_context = std::make_unique<core::AppContext>(m_dir->filePath(QStringLiteral("fasting.sqlite")));
    m_out.clear();
    m_err.clear();
}

void CommandRunnerTest::cleanup()
{
    m_context.reset();
    m_dir.reset();
}

int CommandRunnerTest::run(const QStringList &arguments)
{
    m_out.clear();
    m_err.clear();

    QCommandLineParser parser;
    app::addCommandLineOptions(parser);
    if (!parser.parse(QStringList{QStringLiteral("fastingctl")} + arguments)) {
        m_err = parser.errorText();
        return -2;
    }

    QTextStream out(&m_out);
    QTextStream err(&m_err);
    app::CommandRunner runner(*m_context, out, err);
    const int exitCode = runner.execute(parser);
    out.flush();
    err.flush();
    return exitCode;
}

void CommandRunnerTest::missingCommandIsUsageError()
{
    QCOMPARE(run({}), app::ExitUsage);
    QVERIFY(m_err.contains(QStringLiteral("No command given.")));
    QVERIFY(m_out.isEmpty());
}

void CommandRunnerTest::unknownCommandIsUsageError()
{
    QCOMPARE(run({QStringLiteral("frobnicate")}), app::ExitUsage);
    QVERIFY(m_err.contains(QStringLiteral("Unknown command 'frobnicate'.")));
}

void CommandRunnerTest::invalidTimeIsUsageError()
{
    QCOMPARE(run({QStringLiteral("start"), QStringLiteral("--at"), QStringLiteral("teatime")}), app::ExitUsage);
    QVERIFY(m_err.contains(QStringLiteral("Invalid time 'teatime'.")));
    QCOMPARE(run({QStringLiteral("windows"), QStringLiteral("--date"), QStringLiteral("2024-13-40")}),
             app::ExitUsage);
}

void CommandRunnerTest::stopWithoutFastFails()
{
    QCOMPARE(run({QStringLiteral("stop"), QStringLiteral("--at"), QStringLiteral("2024-03-04T20:00:00")}),
             app::ExitFailed);
    QVERIFY(m_err.contains(QStringLiteral("There is no fast to stop.")));
}

void CommandRunnerTest::startAndStopFast()
{
    QCOMPARE(run({QStringLiteral("start"), QStringLiteral("--at"), QStringLiteral("2024-03-04T20:00:00")}),
             app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("Fast started at 2024-03-04T20:00")));

    QCOMPARE(run({QStringLiteral("windows"), QStringLiteral("--date"), QStringLiteral("2024-03-04")}), app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("  fast  2024-03-04T20:00")));

    QCOMPARE(run({QStringLiteral("stop"), QStringLiteral("--at"), QStringLiteral("2024-03-05T12:00:00")}),
             app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("Fast stopped at 2024-03-05T12:00")));

    QCOMPARE(run({QStringLiteral("windows"), QStringLiteral("--date"), QStringLiteral("2024-03-05")}), app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("  eat  2024-03-05T12:00")));
    QVERIFY(m_err.isEmpty());
}

void CommandRunnerTest::createRejectsEndBeforeStart()
{
    QCOMPARE(run({QStringLiteral("create"), QStringLiteral("fast"), QStringLiteral("2024-03-04T20:00:00"),
                  QStringLiteral("2024-03-04T18:00:00")}),
             app::ExitFailed);
    QVERIFY(m_err.contains(QStringLiteral("The end of a window must not be before its start.")));

    QCOMPARE(run({QStringLiteral("create"), QStringLiteral("snack"), QStringLiteral("2024-03-04T18:00:00"),
                  QStringLiteral("2024-03-04T20:00:00")}),
             app::ExitUsage);

    QCOMPARE(run({QStringLiteral("create"), QStringLiteral("eat"), QStringLiteral("2024-03-04T12:00:00"),
                  QStringLiteral("2024-03-04T18:00:00"), QStringLiteral("--note"), QStringLiteral("lunch")}),
             app::ExitOk);
    QCOMPARE(run({QStringLiteral("windows"), QStringLiteral("--date"), QStringLiteral("2024-03-04")}), app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("  user  lunch")));
}

void CommandRunnerTest::regimenAndLeadTime()
{
    QCOMPARE(run({QStringLiteral("regimen-save"), QStringLiteral("Warrior"), QStringLiteral("20"), QStringLiteral("4"),
                  QStringLiteral("--activate")}),
             app::ExitOk);
    QVERIFY(m_out.startsWith(QStringLiteral("Regimen saved: ")));

    QCOMPARE(run({QStringLiteral("regimens")}), app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("* Warrior")));

    QCOMPARE(run({QStringLiteral("regimen-save"), QStringLiteral("Broken"), QStringLiteral("many"), QStringLiteral("4")}),
             app::ExitUsage);
    QCOMPARE(run({QStringLiteral("regimen-activate"), QStringLiteral("not-a-uuid")}), app::ExitUsage);

    QCOMPARE(run({QStringLiteral("lead-time"), QStringLiteral("45")}), app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("Reminder lead time: 45 min")));
    QCOMPARE(run({QStringLiteral("lead-time"), QStringLiteral("soon")}), app::ExitUsage);
    QCOMPARE(run({QStringLiteral("lead-time")}), app::ExitOk);
    QVERIFY(m_out.contains(QStringLiteral("Reminder lead time: 45 min")));
}

void CommandRunnerTest::exportWritesSnapshot()
{
    QCOMPARE(run({QStringLiteral("start"), QStringLiteral("--at"), QStringLiteral("2024-03-04T20:00:00")}),
             app::ExitOk);

    const QString target = m_dir->filePath(QStringLiteral("backup.sqlite"));
    QCOMPARE(run({QStringLiteral("export"), target}), app::ExitOk);
    QVERIFY(m_out.contains(target));
    QVERIFY(QFileInfo(target).size() > 0);

    QCOMPARE(run({QStringLiteral("export")}), app::ExitUsage);
}

void CommandRunnerTest::importOfMissingFileFails()
{
    QCOMPARE(run({QStringLiteral("import"), m_dir->filePath(QStringLiteral("missing.sqlite"))}), app::ExitFailed);
    QVERIFY(!m_err.isEmpty());
    QVERIFY(m_out.isEmpty());
}

QTEST_GUILESS_MAIN(CommandRunnerTest)
#include "CommandRunnerTest.moc"
