#pragma once

#include <functional>

#include <QDateTime>

namespace fasting {
namespace core {

using NowProvider = std::function<QDateTime()>;

inline NowProvider systemClock()
{
    return [] { return QDateTime::currentDateTime(); };
}

} // namespace core
} // namespace fasting
