#include "fasting/core/Logging.hpp"

namespace fasting {
namespace core {

LogLevel logLevelFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("trace")) {
        return LogLevel::Trace;
    }
    if (key == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (key == QLatin1String("warn") || key == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (key == QLatin1String("error")) {
        return LogLevel::Error;
    }
    if (key == QLatin1String("off")) {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

void setLogLevel(LogLevel level)
{
    switch (level) {
    case LogLevel::Trace:
        spdlog::set_level(spdlog::level::trace);
        break;
    case LogLevel::Debug:
        spdlog::set_level(spdlog::level::debug);
        break;
    case LogLevel::Info:
        spdlog::set_level(spdlog::level::info);
        break;
    case LogLevel::Warn:
        spdlog::set_level(spdlog::level::warn);
        break;
    case LogLevel::Error:
        spdlog::set_level(spdlog::level::err);
        break;
    case LogLevel::Off:
        spdlog::set_level(spdlog::level::off);
        break;
    }
}

} // namespace core
} // namespace fasting
