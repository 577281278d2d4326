#pragma once

#include <QHash>
#include <QObject>
#include <QTimer>

#include "fasting/core/Clock.hpp"
#include "fasting/notify/NotificationCenter.hpp"

namespace fasting {
namespace notify {

// Delivers reminders in-process: a periodic tick emits delivered() for every
// pending request whose fire time has passed.
class TimerNotificationCenter : public QObject, public NotificationCenter
{
    Q_OBJECT

public:
    explicit TimerNotificationCenter(core::NowProvider now = core::systemClock(), QObject *parent = nullptr);
    ~TimerNotificationCenter() override;

    AuthorizationStatus authorizationStatus() const override;
    AuthorizationStatus requestAuthorization() override;
    std::vector<ReminderEvent> pendingRequests() const override;
    bool add(const ReminderEvent &event) override;
    void remove(const QStringList &identifiers) override;

    void start(int intervalMs = 1000);
    void stop();

public slots:
    void deliverDue();

signals:
    void delivered(const fasting::notify::ReminderEvent &event);

private:
    core::NowProvider m_now;
    QTimer m_ticker;
    QHash<QString, ReminderEvent> m_pending;
};

} // namespace notify
} // namespace fasting
