#include "fasting/data/InMemoryFastingWindowStore.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <algorithm>

#include "fasting/data/DatabaseError.hpp"
#include "fasting/data/Timestamps.hpp"

namespace fasting {
namespace data {

namespace {
constexpr auto SnapshotFormat = "fasting-snapshot";
constexpr int SnapshotVersion = 1;

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QJsonObject windowToJson(const FastingWindow &window)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), prepareUid(window.id));
    object.insert(QStringLiteral("type"), windowTypeToString(window.type));
    object.insert(QStringLiteral("start"), toEpochSeconds(window.start));
    object.insert(QStringLiteral("end"), toEpochSeconds(window.end));
    object.insert(QStringLiteral("note"), window.note.isNull() ? QJsonValue() : QJsonValue(window.note));
    object.insert(QStringLiteral("source"), windowSourceToString(window.source));
    object.insert(QStringLiteral("createdAt"), toEpochSeconds(window.createdAt));
    object.insert(QStringLiteral("updatedAt"), toEpochSeconds(window.updatedAt));
    return object;
}

QJsonObject regimenToJson(const FastingRegimen &regimen)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), prepareUid(regimen.id));
    object.insert(QStringLiteral("name"), regimen.name);
    object.insert(QStringLiteral("fastDuration"), static_cast<double>(regimen.fastDuration));
    object.insert(QStringLiteral("feedDuration"), static_cast<double>(regimen.feedDuration));
    object.insert(QStringLiteral("isActive"), regimen.isActive);
    object.insert(QStringLiteral("createdAt"), toEpochSeconds(regimen.createdAt));
    object.insert(QStringLiteral("updatedAt"), toEpochSeconds(regimen.updatedAt));
    return object;
}

FastingWindow windowFromJson(const QJsonObject &object)
{
    FastingWindow window;
    window.id = QUuid(object.value(QStringLiteral("id")).toString());
    if (window.id.isNull()) {
        throw DatabaseError(DatabaseError::Kind::Execution, QStringLiteral("Invalid window UUID in snapshot."));
    }
    const auto type = windowTypeFromString(object.value(QStringLiteral("type")).toString());
    if (!type) {
        throw DatabaseError(DatabaseError::Kind::Execution, QStringLiteral("Invalid window type in snapshot."));
    }
    window.type = *type;
    window.start = fromEpochSeconds(object.value(QStringLiteral("start")).toDouble());
    window.end = fromEpochSeconds(object.value(QStringLiteral("end")).toDouble());
    const QJsonValue note = object.value(QStringLiteral("note"));
    if (note.isString()) {
        window.note = note.toString();
    }
    window.source = windowSourceFromString(object.value(QStringLiteral("source")).toString());
    window.createdAt = fromEpochSeconds(object.value(QStringLiteral("createdAt")).toDouble());
    window.updatedAt = fromEpochSeconds(object.value(QStringLiteral("updatedAt")).toDouble());
    return window;
}

FastingRegimen regimenFromJson(const QJsonObject &object)
{
    FastingRegimen regimen;
    regimen.id = QUuid(object.value(QStringLiteral("id")).toString());
    if (regimen.id.isNull()) {
        throw DatabaseError(DatabaseError::Kind::Execution, QStringLiteral("Invalid regimen UUID in snapshot."));
    }
    regimen.name = object.value(QStringLiteral("name")).toString();
    regimen.fastDuration = qRound64(object.value(QStringLiteral("fastDuration")).toDouble());
    regimen.feedDuration = qRound64(object.value(QStringLiteral("feedDuration")).toDouble());
    regimen.isActive = object.value(QStringLiteral("isActive")).toBool();
    regimen.createdAt = fromEpochSeconds(object.value(QStringLiteral("createdAt")).toDouble());
    regimen.updatedAt = fromEpochSeconds(object.value(QStringLiteral("updatedAt")).toDouble());
    return regimen;
}

bool matchesType(const FastingWindow &window, const std::optional<WindowType> &type)
{
    return !type || window.type == *type;
}
} // namespace

InMemoryFastingWindowStore::InMemoryFastingWindowStore(core::NowProvider now)
    : InMemoryFastingWindowStore({}, {}, std::move(now))
{
}

InMemoryFastingWindowStore::InMemoryFastingWindowStore(const std::vector<FastingWindow> &windows,
                                                       const std::vector<FastingRegimen> &regimens,
                                                       core::NowProvider now)
    : m_now(std::move(now))
{
    for (const auto &window : windows) {
        m_windows.insert(window.id, window);
    }
    for (const auto &regimen : regimens) {
        m_regimens.insert(regimen.id, regimen);
    }
    ensureActiveRegimen();
}

InMemoryFastingWindowStore::~InMemoryFastingWindowStore() = default;

std::vector<FastingWindow> InMemoryFastingWindowStore::fetchWindows(const QDateTime &from, const QDateTime &to) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<FastingWindow> windows;
    for (const auto &window : m_windows) {
        if (window.intersects(from, to)) {
            windows.push_back(window);
        }
    }
    std::sort(windows.begin(), windows.end(), [](const FastingWindow &lhs, const FastingWindow &rhs) {
        return lhs.start < rhs.start;
    });
    return windows;
}

std::optional<FastingWindow> InMemoryFastingWindowStore::fetchActiveWindow(const QDateTime &at) const
{
    QMutexLocker locker(&m_mutex);
    std::optional<FastingWindow> active;
    for (const auto &window : m_windows) {
        if (window.contains(at) && (!active || window.start > active->start)) {
            active = window;
        }
    }
    return active;
}

std::optional<FastingWindow> InMemoryFastingWindowStore::fetchWindow(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    if (m_windows.contains(id)) {
        return m_windows.value(id);
    }
    return std::nullopt;
}

std::optional<FastingWindow> InMemoryFastingWindowStore::fetchMostRecentWindow(const QDateTime &before,
                                                                               std::optional<WindowType> type) const
{
    QMutexLocker locker(&m_mutex);
    std::optional<FastingWindow> recent;
    for (const auto &window : m_windows) {
        if (!matchesType(window, type) || window.start > before) {
            continue;
        }
        if (!recent || window.start > recent->start) {
            recent = window;
        }
    }
    return recent;
}

std::optional<FastingWindow> InMemoryFastingWindowStore::fetchNextWindow(const QDateTime &after,
                                                                         std::optional<WindowType> type) const
{
    QMutexLocker locker(&m_mutex);
    std::optional<FastingWindow> next;
    for (const auto &window : m_windows) {
        if (!matchesType(window, type) || window.start < after) {
            continue;
        }
        if (!next || window.start < next->start) {
            next = window;
        }
    }
    return next;
}

void InMemoryFastingWindowStore::saveWindow(const FastingWindow &window, const QString &note, WindowSource source)
{
    QMutexLocker locker(&m_mutex);
    FastingWindow stored = window;
    stored.note = note;
    stored.source = source;
    stored.createdAt = m_windows.contains(window.id) ? m_windows.value(window.id).createdAt : window.start;
    stored.updatedAt = m_now();
    m_windows.insert(stored.id, stored);
}

void InMemoryFastingWindowStore::deleteWindow(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    m_windows.remove(id);
}

std::vector<FastingRegimen> InMemoryFastingWindowStore::fetchRegimens()
{
    QMutexLocker locker(&m_mutex);
    if (m_regimens.isEmpty()) {
        ensureActiveRegimen();
    }
    return sortedRegimens();
}

std::optional<FastingRegimen> InMemoryFastingWindowStore::fetchActiveRegimen()
{
    QMutexLocker locker(&m_mutex);
    ensureActiveRegimen();
    for (const auto &regimen : m_regimens) {
        if (regimen.isActive) {
            return regimen;
        }
    }
    return std::nullopt;
}

void InMemoryFastingWindowStore::saveRegimen(const FastingRegimen &regimen)
{
    QMutexLocker locker(&m_mutex);
    FastingRegimen stored = regimen;
    if (m_regimens.contains(regimen.id)) {
        stored.createdAt = m_regimens.value(regimen.id).createdAt;
    } else if (!stored.createdAt.isValid()) {
        stored.createdAt = m_now();
    }
    stored.updatedAt = m_now();
    m_regimens.insert(stored.id, stored);
    if (stored.isActive) {
        activateOnly(stored.id);
    } else {
        ensureActiveRegimen();
    }
}

void InMemoryFastingWindowStore::deleteRegimen(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    if (!m_regimens.contains(id)) {
        return;
    }
    const bool wasActive = m_regimens.value(id).isActive;
    m_regimens.remove(id);
    if (wasActive && !m_regimens.isEmpty()) {
        activateOnly(sortedRegimens().front().id);
    }
    ensureActiveRegimen();
}

void InMemoryFastingWindowStore::setActiveRegimen(const std::optional<QUuid> &id)
{
    QMutexLocker locker(&m_mutex);
    if (id) {
        if (!m_regimens.contains(*id)) {
            throw DatabaseError(DatabaseError::Kind::Execution,
                                QStringLiteral("No fasting regimen with id %1.").arg(prepareUid(*id)));
        }
        activateOnly(*id);
        return;
    }
    if (m_regimens.isEmpty()) {
        ensureActiveRegimen();
        return;
    }
    activateOnly(sortedRegimens().front().id);
}

QByteArray InMemoryFastingWindowStore::exportSnapshot()
{
    QMutexLocker locker(&m_mutex);
    QJsonArray windows;
    for (const auto &window : m_windows) {
        windows.append(windowToJson(window));
    }
    QJsonArray regimens;
    for (const auto &regimen : sortedRegimens()) {
        regimens.append(regimenToJson(regimen));
    }
    QJsonObject root;
    root.insert(QStringLiteral("format"), QString::fromLatin1(SnapshotFormat));
    root.insert(QStringLiteral("version"), SnapshotVersion);
    root.insert(QStringLiteral("windows"), windows);
    root.insert(QStringLiteral("regimens"), regimens);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

void InMemoryFastingWindowStore::importSnapshot(const QString &sourcePath)
{
    QFile file(sourcePath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw DatabaseError(DatabaseError::Kind::OpenDatabase,
                            QStringLiteral("Unable to open snapshot %1: %2").arg(sourcePath, file.errorString()));
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        throw DatabaseError(DatabaseError::Kind::Execution,
                            QStringLiteral("Snapshot is not a valid document: %1").arg(parseError.errorString()));
    }
    const QJsonObject root = document.object();
    if (root.value(QStringLiteral("format")).toString() != QLatin1String(SnapshotFormat)) {
        throw DatabaseError(DatabaseError::Kind::Execution, QStringLiteral("Snapshot does not contain fasting data."));
    }

    QHash<QUuid, FastingWindow> windows;
    for (const auto &value : root.value(QStringLiteral("windows")).toArray()) {
        const FastingWindow window = windowFromJson(value.toObject());
        windows.insert(window.id, window);
    }
    QHash<QUuid, FastingRegimen> regimens;
    for (const auto &value : root.value(QStringLiteral("regimens")).toArray()) {
        const FastingRegimen regimen = regimenFromJson(value.toObject());
        regimens.insert(regimen.id, regimen);
    }

    QMutexLocker locker(&m_mutex);
    m_windows.swap(windows);
    m_regimens.swap(regimens);
    ensureActiveRegimen();
}

void InMemoryFastingWindowStore::resetDatabase()
{
    QMutexLocker locker(&m_mutex);
    m_windows.clear();
    m_regimens.clear();
    ensureActiveRegimen();
}

std::vector<FastingRegimen> InMemoryFastingWindowStore::sortedRegimens() const
{
    std::vector<FastingRegimen> regimens;
    regimens.reserve(static_cast<size_t>(m_regimens.size()));
    for (const auto &regimen : m_regimens) {
        regimens.push_back(regimen);
    }
    std::sort(regimens.begin(), regimens.end(), [](const FastingRegimen &lhs, const FastingRegimen &rhs) {
        if (lhs.createdAt != rhs.createdAt) {
            return lhs.createdAt < rhs.createdAt;
        }
        return prepareUid(lhs.id) < prepareUid(rhs.id);
    });
    return regimens;
}

void InMemoryFastingWindowStore::ensureActiveRegimen()
{
    if (m_regimens.isEmpty()) {
        const FastingRegimen regimen = makeDefaultRegimen(m_now());
        m_regimens.insert(regimen.id, regimen);
        return;
    }

    std::optional<FastingRegimen> keep;
    int activeCount = 0;
    for (const auto &regimen : m_regimens) {
        if (!regimen.isActive) {
            continue;
        }
        ++activeCount;
        if (!keep || regimen.updatedAt > keep->updatedAt) {
            keep = regimen;
        }
    }
    if (activeCount == 1) {
        return;
    }
    activateOnly(keep ? keep->id : sortedRegimens().front().id);
}

void InMemoryFastingWindowStore::activateOnly(const QUuid &id)
{
    const QDateTime now = m_now();
    for (auto it = m_regimens.begin(); it != m_regimens.end(); ++it) {
        const bool active = it.key() == id;
        if (active) {
            it->updatedAt = now;
        }
        it->isActive = active;
    }
}

} // namespace data
} // namespace fasting
