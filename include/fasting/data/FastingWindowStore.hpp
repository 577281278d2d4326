#pragma once

#include <optional>
#include <vector>

#include <QByteArray>

#include "fasting/data/FastingRegimen.hpp"
#include "fasting/data/FastingWindow.hpp"

namespace fasting {
namespace data {

// Durable timeline of windows plus the regimen table. Every call is atomic
// on its own; failures throw DatabaseError and never leave a partial commit.
// Non-overlap of windows is not enforced here, the timeline reconciler keeps it.
class FastingWindowStore
{
public:
    virtual ~FastingWindowStore() = default;

    // Windows with start < to and end > from, ascending by start.
    virtual std::vector<FastingWindow> fetchWindows(const QDateTime &from, const QDateTime &to) const = 0;
    // Latest-starting window with start <= at < end.
    virtual std::optional<FastingWindow> fetchActiveWindow(const QDateTime &at) const = 0;
    virtual std::optional<FastingWindow> fetchWindow(const QUuid &id) const = 0;
    virtual std::optional<FastingWindow> fetchMostRecentWindow(const QDateTime &before,
                                                               std::optional<WindowType> type) const = 0;
    virtual std::optional<FastingWindow> fetchNextWindow(const QDateTime &after,
                                                         std::optional<WindowType> type) const = 0;

    // Upsert by id. created_at is the window start on first insert, updated_at is now.
    virtual void saveWindow(const FastingWindow &window, const QString &note, WindowSource source) = 0;
    void saveWindow(const FastingWindow &window, WindowSource source)
    {
        saveWindow(window, window.note, source);
    }
    virtual void deleteWindow(const QUuid &id) = 0;

    // Seeds the default regimen when the table is empty.
    virtual std::vector<FastingRegimen> fetchRegimens() = 0;
    virtual std::optional<FastingRegimen> fetchActiveRegimen() = 0;
    virtual void saveRegimen(const FastingRegimen &regimen) = 0;
    virtual void deleteRegimen(const QUuid &id) = 0;
    // Clears all active flags and sets the given one, or the earliest-created
    // regimen when no id is given.
    virtual void setActiveRegimen(const std::optional<QUuid> &id) = 0;

    virtual QByteArray exportSnapshot() = 0;
    virtual void importSnapshot(const QString &sourcePath) = 0;
    virtual void resetDatabase() = 0;
};

} // namespace data
} // namespace fasting
