#include "fasting/core/Durations.hpp"

#include <algorithm>

namespace fasting {
namespace core {

EffectiveDurations effectiveDurations(const std::optional<data::FastingRegimen> &regimen)
{
    EffectiveDurations durations;
    if (regimen) {
        durations.fastSecs = std::max<qint64>(regimen->fastDuration, 0);
        durations.feedSecs = std::max<qint64>(regimen->feedDuration, 0);
    }
    return durations;
}

} // namespace core
} // namespace fasting
