#include <QtTest/QtTest>

#include "fasting/notify/TimerNotificationCenter.hpp"

using namespace fasting;
using namespace fasting::notify;

class TimerNotificationCenterTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void deliversDueEventsInOrder();
    void tickerDeliversOnceDue();
    void rejectsInvalidRequests();
    void removedEventsAreNotDelivered();

private:
    QDateTime m_now;
    core::NowProvider clock()
    {
        return [this] { return m_now; };
    }
};

void TimerNotificationCenterTest::init()
{
    m_now = QDateTime(QDate(2024, 6, 3), QTime(8, 0));
}

void TimerNotificationCenterTest::deliversDueEventsInOrder()
{
    TimerNotificationCenter center(clock());
    QSignalSpy spy(&center, &TimerNotificationCenter::delivered);

    QVERIFY(center.add({QStringLiteral("fasting.switch.b"), m_now.addSecs(-60), QStringLiteral("B"), QString()}));
    QVERIFY(center.add({QStringLiteral("fasting.switch.a"), m_now.addSecs(-120), QStringLiteral("A"), QString()}));
    QVERIFY(center.add({QStringLiteral("fasting.switch.c"), m_now.addSecs(600), QStringLiteral("C"), QString()}));

    center.deliverDue();

    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.at(0).at(0).value<ReminderEvent>().title, QStringLiteral("A"));
    QCOMPARE(spy.at(1).at(0).value<ReminderEvent>().title, QStringLiteral("B"));
    QCOMPARE(center.pendingRequests().size(), size_t(1));
    QCOMPARE(center.pendingRequests().front().title, QStringLiteral("C"));

    center.deliverDue();
    QCOMPARE(spy.count(), 2);
}

void TimerNotificationCenterTest::tickerDeliversOnceDue()
{
    TimerNotificationCenter center(clock());
    QSignalSpy spy(&center, &TimerNotificationCenter::delivered);
    QVERIFY(center.add({QStringLiteral("fasting.switch.x"), m_now.addSecs(30), QStringLiteral("X"), QString()}));

    center.start(10);
    QTest::qWait(50);
    QCOMPARE(spy.count(), 0);

    m_now = m_now.addSecs(31);
    QTRY_COMPARE(spy.count(), 1);
    center.stop();
    QVERIFY(center.pendingRequests().empty());
}

void TimerNotificationCenterTest::rejectsInvalidRequests()
{
    TimerNotificationCenter center(clock());
    QVERIFY(!center.add({QString(), m_now, QStringLiteral("Nameless"), QString()}));
    QVERIFY(!center.add({QStringLiteral("fasting.switch.y"), QDateTime(), QStringLiteral("Timeless"), QString()}));
    QVERIFY(center.pendingRequests().empty());
    QCOMPARE(center.authorizationStatus(), AuthorizationStatus::Authorized);
}

void TimerNotificationCenterTest::removedEventsAreNotDelivered()
{
    TimerNotificationCenter center(clock());
    QSignalSpy spy(&center, &TimerNotificationCenter::delivered);
    QVERIFY(center.add({QStringLiteral("fasting.switch.z"), m_now.addSecs(-1), QStringLiteral("Z"), QString()}));

    center.remove({QStringLiteral("fasting.switch.z")});
    center.deliverDue();

    QCOMPARE(spy.count(), 0);
}

QTEST_GUILESS_MAIN(TimerNotificationCenterTest)
#include "TimerNotificationCenterTest.moc"
