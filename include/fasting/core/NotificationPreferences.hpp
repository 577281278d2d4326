#pragma once

#include <memory>

#include <QString>

class QSettings;

namespace fasting {
namespace core {

class NotificationPreferences
{
public:
    static constexpr qint64 DefaultLeadTimeSecs = 30 * 60;

    // Uses the application's QSettings unless a settings file is given.
    explicit NotificationPreferences(const QString &settingsFile = QString());
    ~NotificationPreferences();

    qint64 leadTimeSecs() const;
    void setLeadTimeSecs(qint64 seconds);

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace core
} // namespace fasting
