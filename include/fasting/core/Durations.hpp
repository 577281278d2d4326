#pragma once

#include <optional>

#include "fasting/data/FastingRegimen.hpp"

namespace fasting {
namespace core {

struct EffectiveDurations
{
    qint64 fastSecs = data::DefaultFastDurationSecs;
    qint64 feedSecs = data::DefaultFeedDurationSecs;
};

// Durations of the given regimen clamped to >= 0, or the 16 h / 8 h
// fallback when no regimen is available.
EffectiveDurations effectiveDurations(const std::optional<data::FastingRegimen> &regimen);

} // namespace core
} // namespace fasting
