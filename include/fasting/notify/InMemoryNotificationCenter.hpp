#pragma once

#include <QHash>

#include "fasting/notify/NotificationCenter.hpp"

namespace fasting {
namespace notify {

class InMemoryNotificationCenter : public NotificationCenter
{
public:
    explicit InMemoryNotificationCenter(AuthorizationStatus status = AuthorizationStatus::Authorized,
                                        AuthorizationStatus grantOnRequest = AuthorizationStatus::Authorized);

    AuthorizationStatus authorizationStatus() const override;
    AuthorizationStatus requestAuthorization() override;
    std::vector<ReminderEvent> pendingRequests() const override;
    bool add(const ReminderEvent &event) override;
    void remove(const QStringList &identifiers) override;

    int addCount() const { return m_addCount; }
    int authorizationRequests() const { return m_authorizationRequests; }

private:
    AuthorizationStatus m_status;
    AuthorizationStatus m_grantOnRequest;
    QHash<QString, ReminderEvent> m_pending;
    int m_addCount = 0;
    int m_authorizationRequests = 0;
};

} // namespace notify
} // namespace fasting
