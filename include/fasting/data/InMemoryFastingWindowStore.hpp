#pragma once

#include <QHash>
#include <QMutex>

#include "fasting/core/Clock.hpp"
#include "fasting/data/FastingWindowStore.hpp"

namespace fasting {
namespace data {

// Mapping-backed store for tests and previews. Snapshots are JSON documents.
class InMemoryFastingWindowStore : public FastingWindowStore
{
public:
    explicit InMemoryFastingWindowStore(core::NowProvider now = core::systemClock());
    InMemoryFastingWindowStore(const std::vector<FastingWindow> &windows,
                               const std::vector<FastingRegimen> &regimens,
                               core::NowProvider now = core::systemClock());
    ~InMemoryFastingWindowStore() override;

    using FastingWindowStore::saveWindow;

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
    std::vector<FastingRegimen> sortedRegimens() const;
    void ensureActiveRegimen();
    void activateOnly(const QUuid &id);

    mutable QMutex m_mutex;
    core::NowProvider m_now;
    QHash<QUuid, FastingWindow> m_windows;
    QHash<QUuid, FastingRegimen> m_regimens;
};

} // namespace data
} // namespace fasting
