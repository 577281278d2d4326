#include "fasting/notify/InMemoryNotificationCenter.hpp"

#include <algorithm>

namespace fasting {
namespace notify {

InMemoryNotificationCenter::InMemoryNotificationCenter(AuthorizationStatus status, AuthorizationStatus grantOnRequest)
    : m_status(status)
    , m_grantOnRequest(grantOnRequest)
{
}

AuthorizationStatus InMemoryNotificationCenter::authorizationStatus() const
{
    return m_status;
}

AuthorizationStatus InMemoryNotificationCenter::requestAuthorization()
{
    ++m_authorizationRequests;
    if (m_status == AuthorizationStatus::NotDetermined) {
        m_status = m_grantOnRequest;
    }
    return m_status;
}

std::vector<ReminderEvent> InMemoryNotificationCenter::pendingRequests() const
{
    std::vector<ReminderEvent> requests;
    requests.reserve(static_cast<size_t>(m_pending.size()));
    for (const auto &event : m_pending) {
        requests.push_back(event);
    }
    std::sort(requests.begin(), requests.end(), [](const ReminderEvent &lhs, const ReminderEvent &rhs) {
        return lhs.fireTime < rhs.fireTime;
    });
    return requests;
}

bool InMemoryNotificationCenter::add(const ReminderEvent &event)
{
    if (event.identifier.isEmpty()) {
        return false;
    }
    m_pending.insert(event.identifier, event);
    ++m_addCount;
    return true;
}

void InMemoryNotificationCenter::remove(const QStringList &identifiers)
{
    for (const auto &identifier : identifiers) {
        m_pending.remove(identifier);
    }
}

} // namespace notify
} // namespace fasting
