#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "planner/core/DayBoundaryScheduler.hpp"
#include "planner/core/WakeAlarm.hpp"

using planner::core::DayBoundaryScheduler;
using planner::core::ManualClock;
using planner::core::StaticSettingsSource;
using planner::testing::at;

namespace {

class FakeWakeAlarm : public planner::core::WakeAlarm
{
public:
    void arm(const QDateTime &when) override
    {
        armedAt = when;
        ++armCount;
    }
    void cancel() override { armedAt = QDateTime(); }
    bool isArmed() const override { return armedAt.isValid(); }

    void fire() { emit fired(); }

    QDateTime armedAt;
    int armCount = 0;
};

} // namespace

class DayBoundarySchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void nextTriggerIsOneMinuteAfterDayStart();
    void startArmsNextBoundary();
    void startAnnouncesCurrentDay();
    void firingRearmsBeforeDispatch();
    void announcesEachLogicalDayOnce();
    void stopCancelsAlarm();
};

void DayBoundarySchedulerTest::nextTriggerIsOneMinuteAfterDayStart()
{
    QCOMPARE(DayBoundaryScheduler::nextTriggerAfter(at(2024, 3, 10, 9, 0), 4), at(2024, 3, 11, 4, 1));
    QCOMPARE(DayBoundaryScheduler::nextTriggerAfter(at(2024, 3, 10, 3, 0), 4), at(2024, 3, 10, 4, 1));
    QCOMPARE(DayBoundaryScheduler::nextTriggerAfter(at(2024, 3, 10, 4, 0), 4), at(2024, 3, 10, 4, 1));
    QCOMPARE(DayBoundaryScheduler::nextTriggerAfter(at(2024, 3, 10, 23, 30), 0), at(2024, 3, 11, 0, 1));
}

void DayBoundarySchedulerTest::startArmsNextBoundary()
{
    auto clock = std::make_shared<ManualClock>(at(2024, 3, 10, 9, 0));
    StaticSettingsSource settings;
    FakeWakeAlarm alarm;
    DayBoundaryScheduler scheduler(alarm, clock, settings);

    scheduler.start();
    QVERIFY(alarm.isArmed());
    QCOMPARE(alarm.armedAt, at(2024, 3, 11, 4, 1));
    QCOMPARE(scheduler.nextTrigger(), at(2024, 3, 11, 4, 1));
}

void DayBoundarySchedulerTest::startAnnouncesCurrentDay()
{
    auto clock = std::make_shared<ManualClock>(at(2024, 3, 11, 10, 0));
    StaticSettingsSource settings;
    FakeWakeAlarm alarm;
    DayBoundaryScheduler scheduler(alarm, clock, settings);
    QSignalSpy spy(&scheduler, &DayBoundaryScheduler::dayBoundaryReached);

    scheduler.start();
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toDateTime(), at(2024, 3, 11, 10, 0));
    QCOMPARE(alarm.armedAt, at(2024, 3, 12, 4, 1));

    // A spurious wake later the same logical day stays quiet.
    clock->setNow(at(2024, 3, 12, 2, 0));
    alarm.fire();
    QCOMPARE(spy.count(), 1);
}

void DayBoundarySchedulerTest::firingRearmsBeforeDispatch()
{
    auto clock = std::make_shared<ManualClock>(at(2024, 3, 10, 9, 0));
    StaticSettingsSource settings;
    FakeWakeAlarm alarm;
    DayBoundaryScheduler scheduler(alarm, clock, settings);
    scheduler.start();

    QDateTime armedDuringDispatch;
    connect(&scheduler, &DayBoundaryScheduler::dayBoundaryReached, this,
            [&]() { armedDuringDispatch = alarm.armedAt; });

    clock->setNow(at(2024, 3, 11, 4, 1));
    alarm.fire();
    QCOMPARE(armedDuringDispatch, at(2024, 3, 12, 4, 1));
    QCOMPARE(alarm.armCount, 2);
}

void DayBoundarySchedulerTest::announcesEachLogicalDayOnce()
{
    auto clock = std::make_shared<ManualClock>(at(2024, 3, 10, 9, 0));
    StaticSettingsSource settings;
    FakeWakeAlarm alarm;
    DayBoundaryScheduler scheduler(alarm, clock, settings);
    QSignalSpy spy(&scheduler, &DayBoundaryScheduler::dayBoundaryReached);
    scheduler.start();

    QCOMPARE(spy.count(), 1);

    clock->setNow(at(2024, 3, 11, 4, 1));
    alarm.fire();
    clock->setNow(at(2024, 3, 11, 4, 5));
    alarm.fire();
    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.at(1).at(0).toDateTime(), at(2024, 3, 11, 4, 1));

    clock->setNow(at(2024, 3, 12, 4, 1));
    alarm.fire();
    QCOMPARE(spy.count(), 3);
    QVERIFY(alarm.isArmed());
}

void DayBoundarySchedulerTest::stopCancelsAlarm()
{
    auto clock = std::make_shared<ManualClock>(at(2024, 3, 10, 9, 0));
    StaticSettingsSource settings;
    FakeWakeAlarm alarm;
    DayBoundaryScheduler scheduler(alarm, clock, settings);
    QSignalSpy spy(&scheduler, &DayBoundaryScheduler::dayBoundaryReached);
    scheduler.start();
    scheduler.stop();
    QCOMPARE(spy.count(), 1);

    QVERIFY(!alarm.isArmed());
    clock->setNow(at(2024, 3, 11, 4, 1));
    alarm.fire();
    QCOMPARE(spy.count(), 1);
}

QTEST_GUILESS_MAIN(DayBoundarySchedulerTest)
#include "DayBoundarySchedulerTest.moc"
