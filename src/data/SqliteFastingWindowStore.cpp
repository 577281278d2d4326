#include "fasting/data/SqliteFastingWindowStore.hpp"

#include <sqlite3.h>

#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QTemporaryDir>

#include "fasting/core/Logging.hpp"
#include "fasting/data/DatabaseError.hpp"
#include "fasting/data/Timestamps.hpp"

namespace fasting {
namespace data {

namespace {
constexpr auto WindowColumns =
    "SELECT id, type, start_date, end_date, note, source, created_at, updated_at FROM fasting_windows ";
constexpr auto RegimenColumns =
    "SELECT id, name, fast_duration, feed_duration, is_active, created_at, updated_at FROM fasting_regimens ";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QString errorMessage(sqlite3 *db)
{
    if (!db) {
        return QStringLiteral("Unknown SQLite error.");
    }
    const char *message = sqlite3_errmsg(db);
    return message ? QString::fromUtf8(message) : QStringLiteral("Unknown SQLite error.");
}

void execute(sqlite3 *db, const char *sql)
{
    char *errmsg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        const QString message = errmsg ? QString::fromUtf8(errmsg) : errorMessage(db);
        sqlite3_free(errmsg);
        throw DatabaseError(DatabaseError::Kind::Execution, message);
    }
}

class Statement
{
public:
    Statement(sqlite3 *db, const QString &sql)
        : m_db(db)
    {
        const QByteArray utf8 = sql.toUtf8();
        if (sqlite3_prepare_v2(db, utf8.constData(), utf8.size(), &m_stmt, nullptr) != SQLITE_OK || !m_stmt) {
            const QString message = errorMessage(db);
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
            throw DatabaseError(DatabaseError::Kind::StatementPreparation, message);
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void bindText(int index, const QString &value)
    {
        const QByteArray utf8 = value.toUtf8();
        checkBind(sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT));
    }

    void bindUuid(int index, const QUuid &id) { bindText(index, prepareUid(id)); }
    void bindDouble(int index, double value) { checkBind(sqlite3_bind_double(m_stmt, index, value)); }
    void bindTime(int index, const QDateTime &value) { bindDouble(index, toEpochSeconds(value)); }
    void bindInt(int index, int value) { checkBind(sqlite3_bind_int(m_stmt, index, value)); }
    void bindNull(int index) { checkBind(sqlite3_bind_null(m_stmt, index)); }

    // true while rows are available
    bool step()
    {
        const int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) {
            return true;
        }
        if (result == SQLITE_DONE) {
            return false;
        }
        throw DatabaseError(DatabaseError::Kind::Step, errorMessage(m_db));
    }

    void run() { step(); }

    bool isNull(int column) const { return sqlite3_column_type(m_stmt, column) == SQLITE_NULL; }
    double columnDouble(int column) const { return sqlite3_column_double(m_stmt, column); }
    int columnInt(int column) const { return sqlite3_column_int(m_stmt, column); }
    qint64 columnInt64(int column) const { return sqlite3_column_int64(m_stmt, column); }
    QDateTime columnTime(int column) const { return fromEpochSeconds(columnDouble(column)); }

    QString columnText(int column) const
    {
        const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(m_stmt, column));
        return text ? QString::fromUtf8(text) : QString();
    }

private:
    void checkBind(int result)
    {
        if (result != SQLITE_OK) {
            throw DatabaseError(DatabaseError::Kind::Binding, errorMessage(m_db));
        }
    }

    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
};

// Rolls back on scope exit unless commit() succeeded.
class Transaction
{
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execute(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (m_committed) {
            return;
        }
        if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            spdlog::warn("Rollback failed: {}", core::logText(errorMessage(m_db)));
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        execute(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_committed = false;
};

qint64 queryCount(sqlite3 *db, const QString &sql)
{
    Statement statement(db, sql);
    return statement.step() ? statement.columnInt64(0) : 0;
}

FastingWindow readWindow(const Statement &statement)
{
    if (statement.isNull(0) || statement.isNull(1)) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Unexpected NULL while decoding fasting window."));
    }
    FastingWindow window;
    window.id = QUuid(statement.columnText(0));
    if (window.id.isNull()) {
        throw DatabaseError(DatabaseError::Kind::Execution, QStringLiteral("Invalid UUID stored in database."));
    }
    const auto type = windowTypeFromString(statement.columnText(1));
    if (!type) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Invalid window type stored in database."));
    }
    window.type = *type;
    window.start = statement.columnTime(2);
    window.end = statement.columnTime(3);
    if (!statement.isNull(4)) {
        window.note = statement.columnText(4);
    }
    window.source = windowSourceFromString(statement.columnText(5));
    window.createdAt = statement.columnTime(6);
    window.updatedAt = statement.columnTime(7);
    return window;
}

FastingRegimen readRegimen(const Statement &statement)
{
    if (statement.isNull(0) || statement.isNull(1)) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Unexpected NULL while decoding fasting regimen."));
    }
    FastingRegimen regimen;
    regimen.id = QUuid(statement.columnText(0));
    if (regimen.id.isNull()) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Invalid regimen UUID stored in database."));
    }
    regimen.name = statement.columnText(1);
    regimen.fastDuration = qRound64(statement.columnDouble(2));
    regimen.feedDuration = qRound64(statement.columnDouble(3));
    regimen.isActive = statement.columnInt(4) == 1;
    regimen.createdAt = statement.columnTime(5);
    regimen.updatedAt = statement.columnTime(6);
    return regimen;
}

std::optional<FastingWindow> firstWindow(Statement &statement)
{
    if (statement.step()) {
        return readWindow(statement);
    }
    return std::nullopt;
}

QString typeFilteredQuery(const char *condition, const std::optional<WindowType> &type, const char *order)
{
    QString sql = QString::fromLatin1(WindowColumns) + QString::fromLatin1(condition);
    if (type) {
        sql += QStringLiteral(" AND type = ?");
    }
    sql += QString::fromLatin1(order);
    return sql;
}
} // namespace

void SqliteFastingWindowStore::ConnectionCloser::operator()(sqlite3 *db) const
{
    if (db) {
        sqlite3_close_v2(db);
    }
}

SqliteFastingWindowStore::SqliteFastingWindowStore(QString filePath, core::NowProvider now)
    : m_filePath(std::move(filePath))
    , m_now(std::move(now))
{
    m_db = openConnection(m_filePath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    configure();
    migrate();
    Transaction transaction(m_db.get());
    ensureDefaultRegimen();
    transaction.commit();
    spdlog::debug("Opened fasting database {}", core::logText(m_filePath));
}

SqliteFastingWindowStore::~SqliteFastingWindowStore() = default;

QString SqliteFastingWindowStore::filePath() const
{
    return m_filePath;
}

std::vector<FastingWindow> SqliteFastingWindowStore::fetchWindows(const QDateTime &from, const QDateTime &to) const
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(),
                        QString::fromLatin1(WindowColumns)
                            + QStringLiteral("WHERE start_date < ? AND end_date > ? ORDER BY start_date ASC;"));
    statement.bindTime(1, to);
    statement.bindTime(2, from);

    std::vector<FastingWindow> windows;
    while (statement.step()) {
        windows.push_back(readWindow(statement));
    }
    return windows;
}

std::optional<FastingWindow> SqliteFastingWindowStore::fetchActiveWindow(const QDateTime &at) const
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(),
                        QString::fromLatin1(WindowColumns)
                            + QStringLiteral("WHERE start_date <= ? AND end_date > ? "
                                             "ORDER BY start_date DESC LIMIT 1;"));
    statement.bindTime(1, at);
    statement.bindTime(2, at);
    return firstWindow(statement);
}

std::optional<FastingWindow> SqliteFastingWindowStore::fetchWindow(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(), QString::fromLatin1(WindowColumns) + QStringLiteral("WHERE id = ? LIMIT 1;"));
    statement.bindUuid(1, id);
    return firstWindow(statement);
}

std::optional<FastingWindow> SqliteFastingWindowStore::fetchMostRecentWindow(const QDateTime &before,
                                                                             std::optional<WindowType> type) const
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(),
                        typeFilteredQuery("WHERE start_date <= ?", type, " ORDER BY start_date DESC LIMIT 1;"));
    statement.bindTime(1, before);
    if (type) {
        statement.bindText(2, windowTypeToString(*type));
    }
    return firstWindow(statement);
}

std::optional<FastingWindow> SqliteFastingWindowStore::fetchNextWindow(const QDateTime &after,
                                                                       std::optional<WindowType> type) const
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(),
                        typeFilteredQuery("WHERE start_date >= ?", type, " ORDER BY start_date ASC LIMIT 1;"));
    statement.bindTime(1, after);
    if (type) {
        statement.bindText(2, windowTypeToString(*type));
    }
    return firstWindow(statement);
}

void SqliteFastingWindowStore::saveWindow(const FastingWindow &window, const QString &note, WindowSource source)
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(), QStringLiteral(R"(
        INSERT INTO fasting_windows
            (id, type, start_date, end_date, note, source, created_at, updated_at)
        VALUES
            (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            type = excluded.type,
            start_date = excluded.start_date,
            end_date = excluded.end_date,
            note = excluded.note,
            source = excluded.source,
            updated_at = excluded.updated_at;
    )"));
    statement.bindUuid(1, window.id);
    statement.bindText(2, windowTypeToString(window.type));
    statement.bindTime(3, window.start);
    statement.bindTime(4, window.end);
    if (note.isNull()) {
        statement.bindNull(5);
    } else {
        statement.bindText(5, note);
    }
    statement.bindText(6, windowSourceToString(source));
    statement.bindTime(7, window.start);
    statement.bindTime(8, m_now());
    statement.run();
}

void SqliteFastingWindowStore::deleteWindow(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    Statement statement(m_db.get(), QStringLiteral("DELETE FROM fasting_windows WHERE id = ?;"));
    statement.bindUuid(1, id);
    statement.run();
}

std::vector<FastingRegimen> SqliteFastingWindowStore::fetchRegimens()
{
    QMutexLocker locker(&m_mutex);
    auto regimens = queryRegimens();
    if (regimens.empty()) {
        Transaction transaction(m_db.get());
        ensureDefaultRegimen();
        transaction.commit();
        regimens = queryRegimens();
    }
    return regimens;
}

std::optional<FastingRegimen> SqliteFastingWindowStore::fetchActiveRegimen()
{
    QMutexLocker locker(&m_mutex);
    if (auto active = queryActiveRegimen()) {
        return active;
    }
    Transaction transaction(m_db.get());
    ensureDefaultRegimen();
    transaction.commit();
    return queryActiveRegimen();
}

void SqliteFastingWindowStore::saveRegimen(const FastingRegimen &regimen)
{
    QMutexLocker locker(&m_mutex);
    const QDateTime now = m_now();
    Transaction transaction(m_db.get());
    {
        Statement statement(m_db.get(), QStringLiteral(R"(
            INSERT INTO fasting_regimens
                (id, name, fast_duration, feed_duration, is_active, created_at, updated_at)
            VALUES
                (?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                name = excluded.name,
                fast_duration = excluded.fast_duration,
                feed_duration = excluded.feed_duration,
                is_active = excluded.is_active,
                updated_at = excluded.updated_at;
        )"));
        statement.bindUuid(1, regimen.id);
        statement.bindText(2, regimen.name);
        statement.bindDouble(3, static_cast<double>(regimen.fastDuration));
        statement.bindDouble(4, static_cast<double>(regimen.feedDuration));
        statement.bindInt(5, regimen.isActive ? 1 : 0);
        statement.bindTime(6, regimen.createdAt.isValid() ? regimen.createdAt : now);
        statement.bindTime(7, now);
        statement.run();
    }
    if (regimen.isActive) {
        activateRegimen(regimen.id);
    } else {
        ensureDefaultRegimen();
    }
    transaction.commit();
}

void SqliteFastingWindowStore::deleteRegimen(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    Transaction transaction(m_db.get());
    bool wasActive = false;
    {
        Statement statement(m_db.get(), QStringLiteral("SELECT is_active FROM fasting_regimens WHERE id = ?;"));
        statement.bindUuid(1, id);
        wasActive = statement.step() && statement.columnInt(0) == 1;
    }
    {
        Statement statement(m_db.get(), QStringLiteral("DELETE FROM fasting_regimens WHERE id = ?;"));
        statement.bindUuid(1, id);
        statement.run();
    }
    if (wasActive && queryCount(m_db.get(), QStringLiteral("SELECT COUNT(*) FROM fasting_regimens;")) > 0) {
        activateEarliestRegimen();
    }
    ensureDefaultRegimen();
    transaction.commit();
}

void SqliteFastingWindowStore::setActiveRegimen(const std::optional<QUuid> &id)
{
    QMutexLocker locker(&m_mutex);
    Transaction transaction(m_db.get());
    if (id) {
        activateRegimen(*id);
    } else if (queryCount(m_db.get(), QStringLiteral("SELECT COUNT(*) FROM fasting_regimens;")) == 0) {
        ensureDefaultRegimen();
    } else {
        activateEarliestRegimen();
    }
    transaction.commit();
}

QByteArray SqliteFastingWindowStore::exportSnapshot()
{
    QMutexLocker locker(&m_mutex);
    QTemporaryDir directory;
    if (!directory.isValid()) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Unable to create export directory: %1").arg(directory.errorString()));
    }
    const QString exportPath = directory.filePath(QStringLiteral("fasting-export.sqlite"));
    {
        Connection destination = openConnection(exportPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        backupInto(destination.get(), m_db.get());
        // Standalone snapshot without -wal/-shm companions.
        execute(destination.get(), "PRAGMA journal_mode = DELETE;");
    }

    QFile file(exportPath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw DatabaseError(DatabaseError::Kind::OpenDatabase,
                            QStringLiteral("Unable to read exported snapshot: %1").arg(file.errorString()));
    }
    return file.readAll();
}

void SqliteFastingWindowStore::importSnapshot(const QString &sourcePath)
{
    QMutexLocker locker(&m_mutex);
    const QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.exists() || !sourceInfo.isFile()) {
        throw DatabaseError(DatabaseError::Kind::OpenDatabase,
                            QStringLiteral("Snapshot file not found: %1").arg(sourcePath));
    }
    if (sourceInfo.canonicalFilePath() == QFileInfo(m_filePath).canonicalFilePath()) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Source database matches destination path."));
    }

    Connection source = openConnection(sourcePath, SQLITE_OPEN_READONLY);
    const qint64 tables = queryCount(source.get(), QStringLiteral(
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' "
        "AND name IN ('fasting_windows', 'fasting_regimens');"));
    if (tables != 2) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Snapshot does not contain a fasting database."));
    }

    backupInto(m_db.get(), source.get());
    configure();
    migrate();
    Transaction transaction(m_db.get());
    ensureDefaultRegimen();
    transaction.commit();
    spdlog::info("Imported fasting database from {}", core::logText(sourcePath));
}

void SqliteFastingWindowStore::resetDatabase()
{
    QMutexLocker locker(&m_mutex);
    Transaction transaction(m_db.get());
    execute(m_db.get(), "DELETE FROM fasting_windows;");
    execute(m_db.get(), "DELETE FROM fasting_regimens;");
    insertDefaultRegimen();
    transaction.commit();
    spdlog::info("Reset fasting database {}", core::logText(m_filePath));
}

SqliteFastingWindowStore::Connection SqliteFastingWindowStore::openConnection(const QString &path, int flags)
{
    sqlite3 *raw = nullptr;
    const int result = sqlite3_open_v2(path.toUtf8().constData(), &raw, flags, nullptr);
    Connection connection(raw);
    if (result != SQLITE_OK || !connection) {
        throw DatabaseError(DatabaseError::Kind::OpenDatabase,
                            QStringLiteral("Unable to open %1: %2").arg(path, errorMessage(raw)));
    }
    sqlite3_busy_timeout(connection.get(), 2000);
    return connection;
}

void SqliteFastingWindowStore::configure()
{
    execute(m_db.get(), "PRAGMA foreign_keys = ON;");
    execute(m_db.get(), "PRAGMA journal_mode = WAL;");
}

void SqliteFastingWindowStore::migrate()
{
    execute(m_db.get(), R"(
        CREATE TABLE IF NOT EXISTS fasting_windows (
            id TEXT PRIMARY KEY,
            type TEXT NOT NULL CHECK (type IN ('fast','eat')),
            start_date REAL NOT NULL,
            end_date REAL NOT NULL,
            note TEXT,
            source TEXT NOT NULL DEFAULT 'user' CHECK (source IN ('user','system')),
            created_at REAL NOT NULL,
            updated_at REAL NOT NULL
        );
    )");
    execute(m_db.get(), "CREATE INDEX IF NOT EXISTS idx_fasting_windows_start ON fasting_windows(start_date);");
    execute(m_db.get(), R"(
        CREATE TABLE IF NOT EXISTS fasting_regimens (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            fast_duration REAL NOT NULL,
            feed_duration REAL NOT NULL,
            is_active INTEGER NOT NULL DEFAULT 0,
            created_at REAL NOT NULL,
            updated_at REAL NOT NULL
        );
    )");
    execute(m_db.get(),
            "CREATE INDEX IF NOT EXISTS idx_fasting_regimens_created ON fasting_regimens(created_at);");
}

std::vector<FastingRegimen> SqliteFastingWindowStore::queryRegimens() const
{
    Statement statement(m_db.get(), QString::fromLatin1(RegimenColumns) + QStringLiteral("ORDER BY created_at ASC, id ASC;"));
    std::vector<FastingRegimen> regimens;
    while (statement.step()) {
        regimens.push_back(readRegimen(statement));
    }
    return regimens;
}

std::optional<FastingRegimen> SqliteFastingWindowStore::queryActiveRegimen() const
{
    Statement statement(m_db.get(),
                        QString::fromLatin1(RegimenColumns)
                            + QStringLiteral("WHERE is_active = 1 ORDER BY updated_at DESC LIMIT 1;"));
    if (statement.step()) {
        return readRegimen(statement);
    }
    return std::nullopt;
}

// Caller holds a transaction.
void SqliteFastingWindowStore::ensureDefaultRegimen()
{
    if (queryCount(m_db.get(), QStringLiteral("SELECT COUNT(*) FROM fasting_regimens;")) == 0) {
        insertDefaultRegimen();
        return;
    }

    const qint64 active = queryCount(m_db.get(),
                                     QStringLiteral("SELECT COUNT(*) FROM fasting_regimens WHERE is_active = 1;"));
    if (active == 0) {
        activateEarliestRegimen();
    } else if (active > 1) {
        execute(m_db.get(), R"(
            UPDATE fasting_regimens SET is_active = 0
            WHERE is_active = 1 AND id != (
                SELECT id FROM fasting_regimens WHERE is_active = 1 ORDER BY updated_at DESC LIMIT 1
            );
        )");
    }
}

void SqliteFastingWindowStore::insertDefaultRegimen()
{
    const FastingRegimen regimen = makeDefaultRegimen(m_now());
    clearActiveFlags();
    Statement statement(m_db.get(), QStringLiteral(R"(
        INSERT OR REPLACE INTO fasting_regimens
            (id, name, fast_duration, feed_duration, is_active, created_at, updated_at)
        VALUES
            (?, ?, ?, ?, 1, ?, ?);
    )"));
    statement.bindUuid(1, regimen.id);
    statement.bindText(2, regimen.name);
    statement.bindDouble(3, static_cast<double>(regimen.fastDuration));
    statement.bindDouble(4, static_cast<double>(regimen.feedDuration));
    statement.bindTime(5, regimen.createdAt);
    statement.bindTime(6, regimen.updatedAt);
    statement.run();
    spdlog::debug("Seeded default regimen {}", core::logText(regimen.id));
}

void SqliteFastingWindowStore::clearActiveFlags()
{
    execute(m_db.get(), "UPDATE fasting_regimens SET is_active = 0;");
}

void SqliteFastingWindowStore::activateRegimen(const QUuid &id)
{
    clearActiveFlags();
    Statement statement(m_db.get(), QStringLiteral("UPDATE fasting_regimens SET is_active = 1, updated_at = ? WHERE id = ?;"));
    statement.bindTime(1, m_now());
    statement.bindUuid(2, id);
    statement.run();
    if (sqlite3_changes(m_db.get()) == 0) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("No fasting regimen with id %1.").arg(prepareUid(id)));
    }
}

void SqliteFastingWindowStore::activateEarliestRegimen()
{
    clearActiveFlags();
    Statement statement(m_db.get(), QStringLiteral(R"(
        UPDATE fasting_regimens
        SET is_active = 1, updated_at = ?
        WHERE id = (SELECT id FROM fasting_regimens ORDER BY created_at ASC, id ASC LIMIT 1);
    )"));
    statement.bindTime(1, m_now());
    statement.run();
}

void SqliteFastingWindowStore::backupInto(sqlite3 *destination, sqlite3 *source) const
{
    sqlite3_backup *backup = sqlite3_backup_init(destination, "main", source, "main");
    if (!backup) {
        throw DatabaseError(DatabaseError::Kind::Execution, errorMessage(destination));
    }
    const int stepResult = sqlite3_backup_step(backup, -1);
    const int finishResult = sqlite3_backup_finish(backup);
    if (stepResult != SQLITE_DONE || finishResult != SQLITE_OK) {
        throw DatabaseError(DatabaseError::Kind::Execution, errorMessage(destination));
    }
}

} // namespace data
} // namespace fasting
