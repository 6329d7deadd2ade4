#include <QtTest/QtTest>

#include <memory>

#include "TestSupport.hpp"
#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/core/DayBoundaryScheduler.hpp"
#include "planner/core/WakeAlarm.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/MutationQueue.hpp"
#include "planner/data/OfflineRepository.hpp"
#include "planner/sync/InMemoryRemoteService.hpp"
#include "planner/sync/RetentionPolicy.hpp"
#include "planner/sync/SyncDriver.hpp"
#include "planner/sync/SyncService.hpp"

using planner::core::DayBoundaryEngine;
using planner::core::DayBoundaryScheduler;
using planner::core::SyncSettings;
using planner::data::Task;
using planner::sync::InMemoryRemoteService;
using planner::sync::RetentionPolicy;
using planner::sync::SyncDriver;
using planner::sync::SyncService;
using planner::testing::TestDatabase;
using planner::testing::at;
using planner::testing::makeDaily;
using planner::testing::makeTask;

namespace {

class FakeWakeAlarm : public planner::core::WakeAlarm
{
public:
    void arm(const QDateTime &when) override { armedAt = when; }
    void cancel() override { armedAt = QDateTime(); }
    bool isArmed() const override { return armedAt.isValid(); }

    void fire() { emit fired(); }

    QDateTime armedAt;
};

SyncSettings withInterval(int seconds)
{
    SyncSettings settings;
    settings.syncIntervalSeconds = seconds;
    return settings;
}

} // namespace

class SyncDriverTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void startAndStopControlTimers();
    void intervalFollowsSettings();
    void syncNowDrainsTheQueue();
    void dayBoundaryRunsRollover();
    void startCatchesUpMissedBoundary();
    void retentionUsesCurrentCeiling();

private:
    std::unique_ptr<TestDatabase> m_db;
    std::shared_ptr<InMemoryRemoteService> m_remote;
    std::shared_ptr<DayBoundaryEngine> m_engine;
    std::shared_ptr<RetentionPolicy> m_retention;
    std::unique_ptr<SyncService> m_service;
    std::unique_ptr<FakeWakeAlarm> m_alarm;
    std::unique_ptr<DayBoundaryScheduler> m_scheduler;
    std::unique_ptr<SyncDriver> m_driver;
};

void SyncDriverTest::init()
{
    m_db = std::make_unique<TestDatabase>(at(2024, 3, 10, 9, 0), withInterval(120));
    QVERIFY(m_db->open());
    const auto &provider = m_db->provider;
    m_remote = std::make_shared<InMemoryRemoteService>(m_db->clock);
    m_engine = provider.dayBoundaryEngine();
    m_retention = std::make_shared<RetentionPolicy>(provider.cacheStore(), provider.mutationQueue(), m_db->clock,
                                                    m_db->settings.current().retentionCeilingBytes);
    m_service = std::make_unique<SyncService>(provider.cacheStore(), provider.metadataStore(),
                                              provider.mutationQueue(), m_remote, m_engine, m_retention, m_db->clock,
                                              m_db->settings);
    m_alarm = std::make_unique<FakeWakeAlarm>();
    m_scheduler = std::make_unique<DayBoundaryScheduler>(*m_alarm, m_db->clock, m_db->settings);
    m_driver = std::make_unique<SyncDriver>(*m_service, *m_retention, *m_engine, *m_scheduler, m_db->settings);
}

void SyncDriverTest::cleanup()
{
    m_driver.reset();
    m_scheduler.reset();
    m_alarm.reset();
    m_service.reset();
    m_retention.reset();
    m_engine.reset();
    m_remote.reset();
    m_db.reset();
}

void SyncDriverTest::startAndStopControlTimers()
{
    QVERIFY(!m_driver->isRunning());
    m_driver->start();
    QVERIFY(m_driver->isRunning());
    QVERIFY(m_alarm->isArmed());
    QCOMPARE(m_alarm->armedAt, at(2024, 3, 11, 4, 1));

    m_driver->stop();
    QVERIFY(!m_driver->isRunning());
    QVERIFY(!m_alarm->isArmed());
}

void SyncDriverTest::intervalFollowsSettings()
{
    QCOMPARE(m_driver->syncIntervalMs(), 120 * 1000);
    m_db->settings.setSettings(withInterval(600));
    QCOMPARE(m_driver->syncIntervalMs(), 600 * 1000);
}

void SyncDriverTest::syncNowDrainsTheQueue()
{
    QVERIFY(m_db->provider.repository().createTask(makeTask(0, QStringLiteral("Queued"), at(2024, 3, 10, 20, 0)))
                .isOk());
    m_driver->syncNow();
    QCOMPARE(m_db->provider.mutationQueue()->countByStatus().pending, 0);
    QVERIFY(m_remote->entity(planner::data::EntityType::Task, 1000).has_value());
}

void SyncDriverTest::dayBoundaryRunsRollover()
{
    QVERIFY(m_engine->runIfNewDay(m_db->clock->now(), 4).isOk());
    Task daily = makeDaily(1, QStringLiteral("Stretch"), at(2024, 3, 10, 8, 0));
    daily.completed = true;
    daily.updatedAt = 100;
    QVERIFY(m_db->provider.cacheStore()->upsert(daily).isOk());

    m_driver->start();
    m_db->clock->setNow(at(2024, 3, 11, 4, 1));
    m_alarm->fire();
    QCOMPARE(m_alarm->armedAt, at(2024, 3, 12, 4, 1));

    QTRY_VERIFY(!m_db->provider.cacheStore()->task(1)->completed);
    QCOMPARE(m_db->provider.cacheStore()->task(1)->reminderTime, at(2024, 3, 11, 8, 0));
    m_driver->stop();
}

void SyncDriverTest::startCatchesUpMissedBoundary()
{
    QVERIFY(m_engine->runIfNewDay(m_db->clock->now(), 4).isOk());
    Task daily = makeDaily(1, QStringLiteral("Stretch"), at(2024, 3, 10, 8, 0));
    daily.completed = true;
    daily.updatedAt = 100;
    QVERIFY(m_db->provider.cacheStore()->upsert(daily).isOk());

    m_db->clock->setNow(at(2024, 3, 11, 10, 0));
    m_driver->start();
    QCOMPARE(m_alarm->armedAt, at(2024, 3, 12, 4, 1));

    QTRY_VERIFY(!m_db->provider.cacheStore()->task(1)->completed);
    QCOMPARE(m_db->provider.cacheStore()->task(1)->reminderTime, at(2024, 3, 11, 8, 0));
    m_driver->stop();
}

void SyncDriverTest::retentionUsesCurrentCeiling()
{
    Task inactive = makeTask(5, QStringLiteral("Old"), at(2024, 3, 1, 8, 0));
    inactive.enabled = false;
    QVERIFY(m_db->provider.cacheStore()->upsert(inactive).isOk());

    SyncSettings tight;
    tight.retentionCeilingBytes = 0;
    m_db->settings.setSettings(tight);
    m_driver->runRetention();
    QCOMPARE(m_retention->ceilingBytes(), quint64(0));
    QVERIFY(!m_db->provider.cacheStore()->task(5).has_value());
}

QTEST_GUILESS_MAIN(SyncDriverTest)
#include "SyncDriverTest.moc"
