#pragma once

#include <memory>
#include <QString>

namespace fasting {
namespace data {

class FastingWindowStore;
class SqliteFastingWindowStore;

class DataProvider
{
public:
    // Opens the database at databasePath, or at defaultDatabasePath() when empty.
    explicit DataProvider(const QString &databasePath = QString());
    ~DataProvider();

    static QString defaultDatabasePath();

    QString databasePath() const;
    FastingWindowStore &store();

private:
    QString m_databasePath;
    std::unique_ptr<SqliteFastingWindowStore> m_store;
};

} // namespace data
} // namespace fasting
