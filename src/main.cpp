#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>
#include <memory>

#include "version.h"

#include "fasting/app/CommandRunner.hpp"
#include "fasting/core/AppContext.hpp"
#include "fasting/core/Logging.hpp"
#include "fasting/data/DatabaseError.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Fasting Tracker"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("fasting-tracker.org"));
    QCoreApplication::setApplicationName(QStringLiteral("fastingctl"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kFastingVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    fasting::app::addCommandLineOptions(parser);
    parser.process(app);
    fasting::core::setLogLevel(fasting::core::logLevelFromName(parser.value(QStringLiteral("log-level"))));

    QTextStream out(stdout);
    QTextStream err(stderr);

    std::unique_ptr<fasting::core::AppContext> context;
    try {
        context = std::make_unique<fasting::core::AppContext>(parser.value(QStringLiteral("database")));
    } catch (const fasting::data::DatabaseError &error) {
        spdlog::critical("Unable to open database: {}", error.what());
        err << QObject::tr("Unable to open database: %1").arg(error.message()) << '\n';
        return fasting::app::ExitFailed;
    }

    fasting::app::CommandRunner runner(*context, out, err);
    const int exitCode = runner.execute(parser);
    out.flush();
    err.flush();
    if (exitCode != fasting::app::ExitRunning) {
        return exitCode;
    }
    return app.exec();
}
