#include <QtTest/QtTest>

#include <QSaveFile>
#include <QTemporaryDir>
#include <algorithm>
#include <memory>

#include "fasting/data/DatabaseError.hpp"
#include "fasting/data/InMemoryFastingWindowStore.hpp"
#include "fasting/data/SqliteFastingWindowStore.hpp"

using namespace fasting::data;

namespace {

FastingWindow makeWindow(WindowType type, const QDateTime &start, const QDateTime &end)
{
    FastingWindow window;
    window.type = type;
    window.start = start;
    window.end = end;
    return window;
}

int activeCount(const std::vector<FastingRegimen> &regimens)
{
    return static_cast<int>(std::count_if(regimens.begin(), regimens.end(),
                                          [](const FastingRegimen &regimen) { return regimen.isActive; }));
}

} // namespace

// Runs the store contract against the SQLite store and the in-memory store.
class FastingWindowStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void fetchWindowsIntersectsRange_data();
    void fetchWindowsIntersectsRange();
    void activeWindowPrefersLatestStart_data();
    void activeWindowPrefersLatestStart();
    void recentAndNextHonorTypeFilter_data();
    void recentAndNextHonorTypeFilter();
    void saveUpsertsAndKeepsCreatedAt_data();
    void saveUpsertsAndKeepsCreatedAt();
    void deleteWindowIsIdempotent_data();
    void deleteWindowIsIdempotent();
    void freshStoreSeedsDefaultRegimen_data();
    void freshStoreSeedsDefaultRegimen();
    void exactlyOneRegimenStaysActive_data();
    void exactlyOneRegimenStaysActive();
    void deletingActiveRegimenPromotesEarliest_data();
    void deletingActiveRegimenPromotesEarliest();
    void equalCreationTimesOrderById_data();
    void equalCreationTimesOrderById();
    void deletingOnlyRegimenSynthesizesDefault_data();
    void deletingOnlyRegimenSynthesizesDefault();
    void activatingUnknownRegimenFails_data();
    void activatingUnknownRegimenFails();
    void resetLeavesOnlyDefaultRegimen_data();
    void resetLeavesOnlyDefaultRegimen();
    void snapshotRoundTrip_data();
    void snapshotRoundTrip();

private:
    void addBackends();
    std::unique_ptr<FastingWindowStore> makeStore(const QString &name);

    std::unique_ptr<QTemporaryDir> m_dir;
    QDateTime m_now;
};

void FastingWindowStoreTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_now = QDateTime(QDate(2024, 3, 4), QTime(9, 0));
}

void FastingWindowStoreTest::cleanup()
{
    m_dir.reset();
}

void FastingWindowStoreTest::addBackends()
{
    QTest::addColumn<QString>("backend");
    QTest::newRow("sqlite") << QStringLiteral("sqlite");
    QTest::newRow("memory") << QStringLiteral("memory");
}

std::unique_ptr<FastingWindowStore> FastingWindowStoreTest::makeStore(const QString &name)
{
    QFETCH(QString, backend);
    auto now = [this] { return m_now; };
    if (backend == QLatin1String("sqlite")) {
        return std::make_unique<SqliteFastingWindowStore>(m_dir->filePath(name + QStringLiteral(".sqlite")), now);
    }
    return std::make_unique<InMemoryFastingWindowStore>(now);
}

void FastingWindowStoreTest::fetchWindowsIntersectsRange_data()
{
    addBackends();
}

void FastingWindowStoreTest::fetchWindowsIntersectsRange()
{
    auto store = makeStore(QStringLiteral("range"));
    const QDateTime day(QDate(2024, 3, 4), QTime(0, 0));

    const auto overnight = makeWindow(WindowType::Fast, day.addSecs(-2 * 3600), day.addSecs(2 * 3600));
    const auto lunch = makeWindow(WindowType::Eat, day.addSecs(10 * 3600), day.addSecs(12 * 3600));
    const auto before = makeWindow(WindowType::Eat, day.addSecs(-5 * 3600), day.addSecs(-3600));
    const auto endsAtStart = makeWindow(WindowType::Fast, day.addSecs(-3 * 3600), day);
    const auto nextDay = makeWindow(WindowType::Fast, day.addDays(1), day.addDays(1).addSecs(3600));

    store->saveWindow(lunch, WindowSource::User);
    store->saveWindow(overnight, WindowSource::User);
    store->saveWindow(before, WindowSource::User);
    store->saveWindow(endsAtStart, WindowSource::User);
    store->saveWindow(nextDay, WindowSource::User);

    const auto windows = store->fetchWindows(day, day.addDays(1));
    QCOMPARE(windows.size(), size_t(2));
    QCOMPARE(windows.at(0).id, overnight.id);
    QCOMPARE(windows.at(1).id, lunch.id);
    QCOMPARE(windows.at(0).start, overnight.start);
    QCOMPARE(windows.at(1).type, WindowType::Eat);
}

void FastingWindowStoreTest::activeWindowPrefersLatestStart_data()
{
    addBackends();
}

void FastingWindowStoreTest::activeWindowPrefersLatestStart()
{
    auto store = makeStore(QStringLiteral("active"));
    const QDateTime at(QDate(2024, 3, 4), QTime(12, 0));

    const auto outer = makeWindow(WindowType::Fast, at.addSecs(-2 * 3600), at.addSecs(2 * 3600));
    const auto inner = makeWindow(WindowType::Eat, at.addSecs(-3600), at.addSecs(3600));
    store->saveWindow(outer, WindowSource::User);
    store->saveWindow(inner, WindowSource::System);

    auto active = store->fetchActiveWindow(at);
    QVERIFY(active.has_value());
    QCOMPARE(active->id, inner.id);
    QCOMPARE(active->source, WindowSource::System);

    active = store->fetchActiveWindow(at.addSecs(3600));
    QVERIFY(active.has_value());
    QCOMPARE(active->id, outer.id);

    QVERIFY(!store->fetchActiveWindow(at.addSecs(2 * 3600)).has_value());
}

void FastingWindowStoreTest::recentAndNextHonorTypeFilter_data()
{
    addBackends();
}

void FastingWindowStoreTest::recentAndNextHonorTypeFilter()
{
    auto store = makeStore(QStringLiteral("neighbours"));
    const QDateTime base(QDate(2024, 3, 4), QTime(8, 0));

    const auto fast = makeWindow(WindowType::Fast, base, base.addSecs(3600));
    const auto eat = makeWindow(WindowType::Eat, base.addSecs(2 * 3600), base.addSecs(3 * 3600));
    const auto laterFast = makeWindow(WindowType::Fast, base.addSecs(4 * 3600), base.addSecs(5 * 3600));
    store->saveWindow(fast, WindowSource::User);
    store->saveWindow(eat, WindowSource::User);
    store->saveWindow(laterFast, WindowSource::User);

    const QDateTime probe = base.addSecs(3 * 3600);
    QCOMPARE(store->fetchMostRecentWindow(probe, std::nullopt)->id, eat.id);
    QCOMPARE(store->fetchMostRecentWindow(probe, WindowType::Fast)->id, fast.id);
    QCOMPARE(store->fetchMostRecentWindow(eat.start, WindowType::Eat)->id, eat.id);
    QVERIFY(!store->fetchMostRecentWindow(base.addSecs(-1), std::nullopt).has_value());

    QCOMPARE(store->fetchNextWindow(base.addSecs(1), std::nullopt)->id, eat.id);
    QCOMPARE(store->fetchNextWindow(base.addSecs(1), WindowType::Fast)->id, laterFast.id);
    QCOMPARE(store->fetchNextWindow(laterFast.start, WindowType::Fast)->id, laterFast.id);
    QVERIFY(!store->fetchNextWindow(laterFast.start.addSecs(1), std::nullopt).has_value());
}

void FastingWindowStoreTest::saveUpsertsAndKeepsCreatedAt_data()
{
    addBackends();
}

void FastingWindowStoreTest::saveUpsertsAndKeepsCreatedAt()
{
    auto store = makeStore(QStringLiteral("upsert"));
    const QDateTime start(QDate(2024, 3, 1), QTime(20, 0));
    auto window = makeWindow(WindowType::Fast, start, start.addSecs(16 * 3600));
    store->saveWindow(window, QStringLiteral("first"), WindowSource::System);

    auto stored = store->fetchWindow(window.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->createdAt, start);
    QCOMPARE(stored->updatedAt, m_now);
    QCOMPARE(stored->note, QStringLiteral("first"));
    QCOMPARE(stored->source, WindowSource::System);

    m_now = m_now.addSecs(600);
    window.start = start.addSecs(3600);
    window.end = start.addSecs(10 * 3600);
    store->saveWindow(window, QStringLiteral("second"), WindowSource::User);

    stored = store->fetchWindow(window.id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->start, window.start);
    QCOMPARE(stored->end, window.end);
    QCOMPARE(stored->createdAt, start);
    QCOMPARE(stored->updatedAt, m_now);
    QCOMPARE(stored->note, QStringLiteral("second"));
    QCOMPARE(stored->source, WindowSource::User);
    QCOMPARE(store->fetchWindows(start.addDays(-1), start.addDays(2)).size(), size_t(1));
}

void FastingWindowStoreTest::deleteWindowIsIdempotent_data()
{
    addBackends();
}

void FastingWindowStoreTest::deleteWindowIsIdempotent()
{
    auto store = makeStore(QStringLiteral("delete"));
    const auto window = makeWindow(WindowType::Eat, m_now, m_now.addSecs(3600));
    store->saveWindow(window, WindowSource::User);

    store->deleteWindow(window.id);
    store->deleteWindow(window.id);
    store->deleteWindow(QUuid::createUuid());
    QVERIFY(!store->fetchWindow(window.id).has_value());
}

void FastingWindowStoreTest::freshStoreSeedsDefaultRegimen_data()
{
    addBackends();
}

void FastingWindowStoreTest::freshStoreSeedsDefaultRegimen()
{
    auto store = makeStore(QStringLiteral("seed"));
    const auto regimens = store->fetchRegimens();
    QCOMPARE(regimens.size(), size_t(1));
    QCOMPARE(regimens.front().name, defaultRegimenName());
    QCOMPARE(regimens.front().fastDuration, DefaultFastDurationSecs);
    QCOMPARE(regimens.front().feedDuration, DefaultFeedDurationSecs);
    QVERIFY(regimens.front().isActive);

    const auto active = store->fetchActiveRegimen();
    QVERIFY(active.has_value());
    QCOMPARE(active->id, regimens.front().id);
}

void FastingWindowStoreTest::exactlyOneRegimenStaysActive_data()
{
    addBackends();
}

void FastingWindowStoreTest::exactlyOneRegimenStaysActive()
{
    auto store = makeStore(QStringLiteral("single-active"));
    const QUuid seeded = store->fetchRegimens().front().id;

    m_now = m_now.addSecs(60);
    FastingRegimen extended;
    extended.name = QStringLiteral("36h");
    extended.fastDuration = 36 * 3600;
    extended.feedDuration = 0;
    extended.isActive = true;
    store->saveRegimen(extended);
    auto regimens = store->fetchRegimens();
    QCOMPARE(regimens.size(), size_t(2));
    QCOMPARE(activeCount(regimens), 1);
    QCOMPARE(store->fetchActiveRegimen()->id, extended.id);

    m_now = m_now.addSecs(60);
    FastingRegimen inactive;
    inactive.name = QStringLiteral("18 · 6");
    inactive.fastDuration = 18 * 3600;
    inactive.feedDuration = 6 * 3600;
    store->saveRegimen(inactive);
    QCOMPARE(activeCount(store->fetchRegimens()), 1);
    QCOMPARE(store->fetchActiveRegimen()->id, extended.id);

    store->setActiveRegimen(inactive.id);
    QCOMPARE(activeCount(store->fetchRegimens()), 1);
    QCOMPARE(store->fetchActiveRegimen()->id, inactive.id);

    store->setActiveRegimen(std::nullopt);
    QCOMPARE(activeCount(store->fetchRegimens()), 1);
    QCOMPARE(store->fetchActiveRegimen()->id, seeded);

    // Saving the active regimen as inactive hands the flag to the earliest one.
    store->setActiveRegimen(extended.id);
    extended.isActive = false;
    store->saveRegimen(extended);
    QCOMPARE(activeCount(store->fetchRegimens()), 1);
    QCOMPARE(store->fetchActiveRegimen()->id, seeded);
}

void FastingWindowStoreTest::deletingActiveRegimenPromotesEarliest_data()
{
    addBackends();
}

void FastingWindowStoreTest::deletingActiveRegimenPromotesEarliest()
{
    auto store = makeStore(QStringLiteral("promote"));
    const QUuid seeded = store->fetchRegimens().front().id;

    m_now = m_now.addSecs(60);
    FastingRegimen other;
    other.name = QStringLiteral("20 · 4");
    other.fastDuration = 20 * 3600;
    other.feedDuration = 4 * 3600;
    other.isActive = true;
    store->saveRegimen(other);

    store->deleteRegimen(other.id);
    const auto regimens = store->fetchRegimens();
    QCOMPARE(regimens.size(), size_t(1));
    QCOMPARE(regimens.front().id, seeded);
    QVERIFY(regimens.front().isActive);

    store->deleteRegimen(other.id);
    QCOMPARE(store->fetchRegimens().size(), size_t(1));
}

void FastingWindowStoreTest::equalCreationTimesOrderById_data()
{
    addBackends();
}

void FastingWindowStoreTest::equalCreationTimesOrderById()
{
    auto store = makeStore(QStringLiteral("tiebreak"));
    const QUuid seeded = store->fetchRegimens().front().id;

    m_now = m_now.addSecs(60);
    FastingRegimen later;
    later.id = QUuid(QStringLiteral("{00000000-0000-0000-0000-00000000000b}"));
    later.name = QStringLiteral("18 · 6");
    later.fastDuration = 18 * 3600;
    later.feedDuration = 6 * 3600;
    store->saveRegimen(later);

    FastingRegimen earlier = later;
    earlier.id = QUuid(QStringLiteral("{00000000-0000-0000-0000-00000000000a}"));
    earlier.name = QStringLiteral("20 · 4");
    store->saveRegimen(earlier);

    auto regimens = store->fetchRegimens();
    QCOMPARE(regimens.size(), size_t(3));
    QCOMPARE(regimens.at(1).createdAt, regimens.at(2).createdAt);
    QCOMPARE(regimens.at(1).id, earlier.id);
    QCOMPARE(regimens.at(2).id, later.id);

    store->deleteRegimen(seeded);
    QCOMPARE(store->fetchActiveRegimen()->id, earlier.id);
}

void FastingWindowStoreTest::deletingOnlyRegimenSynthesizesDefault_data()
{
    addBackends();
}

void FastingWindowStoreTest::deletingOnlyRegimenSynthesizesDefault()
{
    auto store = makeStore(QStringLiteral("synthesize"));
    const QUuid seeded = store->fetchRegimens().front().id;

    store->deleteRegimen(seeded);

    const auto active = store->fetchActiveRegimen();
    QVERIFY(active.has_value());
    QVERIFY(active->id != seeded);
    QCOMPARE(active->name, defaultRegimenName());
    QVERIFY(!store->fetchRegimens().empty());
}

void FastingWindowStoreTest::activatingUnknownRegimenFails_data()
{
    addBackends();
}

void FastingWindowStoreTest::activatingUnknownRegimenFails()
{
    auto store = makeStore(QStringLiteral("unknown"));
    const QUuid seeded = store->fetchActiveRegimen()->id;

    bool thrown = false;
    try {
        store->setActiveRegimen(QUuid::createUuid());
    } catch (const DatabaseError &error) {
        thrown = true;
        QCOMPARE(error.kind(), DatabaseError::Kind::Execution);
    }
    QVERIFY(thrown);

    const auto regimens = store->fetchRegimens();
    QCOMPARE(activeCount(regimens), 1);
    QCOMPARE(store->fetchActiveRegimen()->id, seeded);
}

void FastingWindowStoreTest::resetLeavesOnlyDefaultRegimen_data()
{
    addBackends();
}

void FastingWindowStoreTest::resetLeavesOnlyDefaultRegimen()
{
    auto store = makeStore(QStringLiteral("reset"));
    store->saveWindow(makeWindow(WindowType::Fast, m_now, m_now.addSecs(3600)), WindowSource::User);
    FastingRegimen custom;
    custom.name = QStringLiteral("Custom");
    custom.fastDuration = 12 * 3600;
    custom.feedDuration = 12 * 3600;
    custom.isActive = true;
    store->saveRegimen(custom);

    store->resetDatabase();

    QVERIFY(store->fetchWindows(m_now.addYears(-10), m_now.addYears(10)).empty());
    const auto regimens = store->fetchRegimens();
    QCOMPARE(regimens.size(), size_t(1));
    QVERIFY(regimens.front().isActive);
    QCOMPARE(regimens.front().name, defaultRegimenName());
}

void FastingWindowStoreTest::snapshotRoundTrip_data()
{
    addBackends();
}

void FastingWindowStoreTest::snapshotRoundTrip()
{
    auto source = makeStore(QStringLiteral("export"));
    auto fast = makeWindow(WindowType::Fast, m_now, m_now.addSecs(16 * 3600));
    fast.note = QStringLiteral("after dinner");
    const auto eat = makeWindow(WindowType::Eat, fast.end, fast.end.addSecs(8 * 3600));
    source->saveWindow(fast, WindowSource::User);
    source->saveWindow(eat, WindowSource::System);

    m_now = m_now.addSecs(60);
    FastingRegimen custom;
    custom.name = QStringLiteral("18 · 6");
    custom.fastDuration = 18 * 3600;
    custom.feedDuration = 6 * 3600;
    custom.isActive = true;
    source->saveRegimen(custom);

    const QByteArray snapshot = source->exportSnapshot();
    QVERIFY(!snapshot.isEmpty());

    const QString snapshotPath = m_dir->filePath(QStringLiteral("snapshot.bin"));
    QSaveFile file(snapshotPath);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(snapshot);
    QVERIFY(file.commit());

    auto target = makeStore(QStringLiteral("import"));
    target->saveWindow(makeWindow(WindowType::Fast, m_now.addDays(-3), m_now.addDays(-2)), WindowSource::User);
    target->importSnapshot(snapshotPath);

    const auto windows = target->fetchWindows(m_now.addYears(-1), m_now.addYears(1));
    QCOMPARE(windows.size(), size_t(2));
    QCOMPARE(windows.at(0).id, fast.id);
    QCOMPARE(windows.at(0).type, WindowType::Fast);
    QCOMPARE(windows.at(0).start, fast.start);
    QCOMPARE(windows.at(0).end, fast.end);
    QCOMPARE(windows.at(0).note, fast.note);
    QCOMPARE(windows.at(1).id, eat.id);
    QCOMPARE(windows.at(1).source, WindowSource::System);

    const auto regimens = target->fetchRegimens();
    QCOMPARE(regimens.size(), size_t(2));
    QCOMPARE(activeCount(regimens), 1);
    QCOMPARE(target->fetchActiveRegimen()->id, custom.id);
    QCOMPARE(target->fetchActiveRegimen()->fastDuration, qint64(18 * 3600));
}

QTEST_GUILESS_MAIN(FastingWindowStoreTest)
#include "FastingWindowStoreTest.moc"
