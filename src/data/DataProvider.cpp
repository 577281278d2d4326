#include "fasting/data/DataProvider.hpp"

#include "fasting/core/Logging.hpp"
#include "fasting/data/SqliteFastingWindowStore.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace fasting {
namespace data {

DataProvider::DataProvider(const QString &databasePath)
    : m_databasePath(databasePath.isEmpty() ? defaultDatabasePath() : databasePath)
{
    const QFileInfo info(m_databasePath);
    QDir dir = info.absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    spdlog::debug("Opening database {}", core::logText(info.absoluteFilePath()));
    m_store = std::make_unique<SqliteFastingWindowStore>(info.absoluteFilePath());
}

DataProvider::~DataProvider() = default;

QString DataProvider::defaultDatabasePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/fasting-tracker");
    }
    QDir dir(storageFolder + QStringLiteral("/FastingData"));
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("fasting.sqlite"));
}

QString DataProvider::databasePath() const
{
    return m_databasePath;
}

FastingWindowStore &DataProvider::store()
{
    return *m_store;
}

} // namespace data
} // namespace fasting
