#pragma once

#include <string>

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <spdlog/spdlog.h>

namespace fasting {
namespace core {

enum class LogLevel
{
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

// Unknown names map to Info.
LogLevel logLevelFromName(const QString &name);
void setLogLevel(LogLevel level);

// spdlog formats std::string; Qt values are converted at the call site.
inline std::string logText(const QString &value)
{
    return value.toStdString();
}

inline std::string logText(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces).toStdString();
}

inline std::string logText(const QDateTime &instant)
{
    return instant.toString(Qt::ISODateWithMs).toStdString();
}

} // namespace core
} // namespace fasting
