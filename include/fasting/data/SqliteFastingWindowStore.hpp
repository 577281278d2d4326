#pragma once

#include <memory>

#include <QMutex>
#include <QString>

#include "fasting/core/Clock.hpp"
#include "fasting/data/FastingWindowStore.hpp"

struct sqlite3;

namespace fasting {
namespace data {

// SQLite-backed store. One connection, guarded by a mutex for the duration of
// every public call; multi-statement operations run inside a transaction.
class SqliteFastingWindowStore : public FastingWindowStore
{
public:
    explicit SqliteFastingWindowStore(QString filePath, core::NowProvider now = core::systemClock());
    ~SqliteFastingWindowStore() override;

    SqliteFastingWindowStore(const SqliteFastingWindowStore &) = delete;
    SqliteFastingWindowStore &operator=(const SqliteFastingWindowStore &) = delete;

    using FastingWindowStore::saveWindow;

    QString filePath() const;

    std::vector<FastingWindow> fetchWindows(const QDateTime &from, const QDateTime &to) const override;
    std::optional<FastingWindow> fetchActiveWindow(const QDateTime &at) const override;
    std::optional<FastingWindow> fetchWindow(const QUuid &id) const override;
    std::optional<FastingWindow> fetchMostRecentWindow(const QDateTime &before,
                                                       std::optional<WindowType> type) const override;
    std::optional<FastingWindow> fetchNextWindow(const QDateTime &after,
                                                 std::optional<WindowType> type) const override;
    void saveWindow(const FastingWindow &window, const QString &note, WindowSource source) override;
    void deleteWindow(const QUuid &id) override;

    std::vector<FastingRegimen> fetchRegimens() override;
    std::optional<FastingRegimen> fetchActiveRegimen() override;
    void saveRegimen(const FastingRegimen &regimen) override;
    void deleteRegimen(const QUuid &id) override;
    void setActiveRegimen(const std::optional<QUuid> &id) override;

    QByteArray exportSnapshot() override;
    void importSnapshot(const QString &sourcePath) override;
    void resetDatabase() override;

private:
    struct ConnectionCloser
    {
        void operator()(sqlite3 *db) const;
    };
    using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;

    static Connection openConnection(const QString &path, int flags);
    void configure();
    void migrate();

    std::vector<FastingRegimen> queryRegimens() const;
    std::optional<FastingRegimen> queryActiveRegimen() const;
    void ensureDefaultRegimen();
    void insertDefaultRegimen();
    void clearActiveFlags();
    void activateRegimen(const QUuid &id);
    void activateEarliestRegimen();
    void backupInto(sqlite3 *destination, sqlite3 *source) const;

    QString m_filePath;
    core::NowProvider m_now;
    Connection m_db;
    mutable QMutex m_mutex;
};

} // namespace data
} // namespace fasting
