#pragma once

#include <vector>

#include <QStringList>

#include "fasting/notify/ReminderEvent.hpp"

namespace fasting {
namespace notify {

enum class AuthorizationStatus
{
    NotDetermined,
    Denied,
    Authorized,
    Provisional,
};

// Interface to the platform service that delivers notifications at a given
// time. add() replaces a pending request with the same identifier.
class NotificationCenter
{
public:
    virtual ~NotificationCenter() = default;

    virtual AuthorizationStatus authorizationStatus() const = 0;
    virtual AuthorizationStatus requestAuthorization() = 0;
    virtual std::vector<ReminderEvent> pendingRequests() const = 0;
    virtual bool add(const ReminderEvent &event) = 0;
    virtual void remove(const QStringList &identifiers) = 0;
};

} // namespace notify
} // namespace fasting
