#include "fasting/data/FastingRegimen.hpp"

namespace fasting {
namespace data {

QString defaultRegimenName()
{
    return QString::fromUtf8("Standard 16 · 8");
}

FastingRegimen makeDefaultRegimen(const QDateTime &now)
{
    FastingRegimen regimen;
    regimen.name = defaultRegimenName();
    regimen.fastDuration = DefaultFastDurationSecs;
    regimen.feedDuration = DefaultFeedDurationSecs;
    regimen.isActive = true;
    regimen.createdAt = now;
    regimen.updatedAt = now;
    return regimen;
}

} // namespace data
} // namespace fasting
