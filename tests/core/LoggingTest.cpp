#include <QtTest/QtTest>

#include "fasting/core/Logging.hpp"

using namespace fasting::core;

class LoggingTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesLevelNames_data();
    void parsesLevelNames();
    void setsSpdlogLevel();
    void formatsQtValues();
};

void LoggingTest::parsesLevelNames_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<int>("level");

    QTest::newRow("trace") << QStringLiteral("trace") << int(LogLevel::Trace);
    QTest::newRow("debug upper") << QStringLiteral(" DEBUG ") << int(LogLevel::Debug);
    QTest::newRow("warning") << QStringLiteral("warning") << int(LogLevel::Warn);
    QTest::newRow("error") << QStringLiteral("error") << int(LogLevel::Error);
    QTest::newRow("off") << QStringLiteral("off") << int(LogLevel::Off);
    QTest::newRow("unknown") << QStringLiteral("chatty") << int(LogLevel::Info);
    QTest::newRow("empty") << QString() << int(LogLevel::Info);
}

void LoggingTest::parsesLevelNames()
{
    QFETCH(QString, name);
    QFETCH(int, level);
    QCOMPARE(int(logLevelFromName(name)), level);
}

void LoggingTest::setsSpdlogLevel()
{
    setLogLevel(LogLevel::Error);
    QCOMPARE(spdlog::get_level(), spdlog::level::err);
    setLogLevel(LogLevel::Debug);
    QCOMPARE(spdlog::get_level(), spdlog::level::debug);
    setLogLevel(LogLevel::Info);
}

void LoggingTest::formatsQtValues()
{
    const QUuid id = QUuid::createUuid();
    QCOMPARE(logText(id), id.toString(QUuid::WithoutBraces).toStdString());
    QCOMPARE(logText(QStringLiteral("Fast")), std::string("Fast"));
    QCOMPARE(logText(QDateTime(QDate(2024, 3, 4), QTime(20, 0))).substr(0, 19), std::string("2024-03-04T20:00:00"));
}

QTEST_GUILESS_MAIN(LoggingTest)
#include "LoggingTest.moc"
