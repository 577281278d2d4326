#include "fasting/notify/TimerNotificationCenter.hpp"

#include <algorithm>

#include "fasting/core/Logging.hpp"

namespace fasting {
namespace notify {

TimerNotificationCenter::TimerNotificationCenter(core::NowProvider now, QObject *parent)
    : QObject(parent)
    , m_now(std::move(now))
{
    qRegisterMetaType<fasting::notify::ReminderEvent>();
    connect(&m_ticker, &QTimer::timeout, this, &TimerNotificationCenter::deliverDue);
}

TimerNotificationCenter::~TimerNotificationCenter() = default;

AuthorizationStatus TimerNotificationCenter::authorizationStatus() const
{
    return AuthorizationStatus::Authorized;
}

AuthorizationStatus TimerNotificationCenter::requestAuthorization()
{
    return AuthorizationStatus::Authorized;
}

std::vector<ReminderEvent> TimerNotificationCenter::pendingRequests() const
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

bool TimerNotificationCenter::add(const ReminderEvent &event)
{
    if (event.identifier.isEmpty() || !event.fireTime.isValid()) {
        return false;
    }
    m_pending.insert(event.identifier, event);
    return true;
}

void TimerNotificationCenter::remove(const QStringList &identifiers)
{
    for (const auto &identifier : identifiers) {
        m_pending.remove(identifier);
    }
}

void TimerNotificationCenter::start(int intervalMs)
{
    m_ticker.start(std::max(intervalMs, 10));
}

void TimerNotificationCenter::stop()
{
    m_ticker.stop();
}

void TimerNotificationCenter::deliverDue()
{
    const QDateTime now = m_now();
    std::vector<ReminderEvent> due;
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it->fireTime <= now) {
            due.push_back(it.value());
            it = m_pending.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(due.begin(), due.end(), [](const ReminderEvent &lhs, const ReminderEvent &rhs) {
        return lhs.fireTime < rhs.fireTime;
    });
    for (const auto &event : due) {
        spdlog::debug("Delivering reminder {}", core::logText(event.identifier));
        emit delivered(event);
    }
}

} // namespace notify
} // namespace fasting
