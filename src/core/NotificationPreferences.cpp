#include "fasting/core/NotificationPreferences.hpp"

#include <QSettings>
#include <algorithm>

namespace fasting {
namespace core {

namespace {
const QString LeadTimeKey = QStringLiteral("notifications/preSwitchLeadTime");
}

constexpr qint64 NotificationPreferences::DefaultLeadTimeSecs;

NotificationPreferences::NotificationPreferences(const QString &settingsFile)
    : m_settings(settingsFile.isEmpty() ? std::make_unique<QSettings>()
                                        : std::make_unique<QSettings>(settingsFile, QSettings::IniFormat))
{
}

NotificationPreferences::~NotificationPreferences() = default;

qint64 NotificationPreferences::leadTimeSecs() const
{
    if (!m_settings->contains(LeadTimeKey)) {
        return DefaultLeadTimeSecs;
    }
    bool ok = false;
    const qint64 stored = m_settings->value(LeadTimeKey).toLongLong(&ok);
    if (!ok) {
        return DefaultLeadTimeSecs;
    }
    return std::max<qint64>(stored, 0);
}

void NotificationPreferences::setLeadTimeSecs(qint64 seconds)
{
    m_settings->setValue(LeadTimeKey, std::max<qint64>(seconds, 0));
    m_settings->sync();
}

} // namespace core
} // namespace fasting
