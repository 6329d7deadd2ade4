#include <QtTest/QtTest>

#include <memory>

#include "TestSupport.hpp"
#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/MutationQueue.hpp"
#include "planner/data/OfflineRepository.hpp"
#include "planner/sync/InMemoryRemoteService.hpp"
#include "planner/sync/RetentionPolicy.hpp"
#include "planner/sync/SyncService.hpp"

using planner::core::Error;
using planner::core::SyncSettings;
using planner::data::EntityType;
using planner::data::Group;
using planner::data::QueueOperation;
using planner::data::Task;
using planner::data::User;
using planner::sync::InMemoryRemoteService;
using planner::sync::RetentionPolicy;
using planner::sync::SyncService;
using planner::sync::SyncState;
using planner::sync::SyncStatus;
using planner::sync::SyncSummary;
using planner::testing::TestDatabase;
using planner::testing::at;
using planner::testing::makeTask;

namespace {
// Local database, in-memory remote and a sync service sharing one manual clock.
struct SyncFixture
{
    explicit SyncFixture(SyncSettings settings = {})
        : db(at(2024, 3, 10, 9, 0), std::move(settings))
    {
    }

    bool open()
    {
        if (!db.open()) {
            return false;
        }
        const auto &provider = db.provider;
        remote = std::make_shared<InMemoryRemoteService>(db.clock);
        retention = std::make_shared<RetentionPolicy>(provider.cacheStore(), provider.mutationQueue(), db.clock,
                                                      db.settings.current().retentionCeilingBytes);
        service = std::make_unique<SyncService>(
            provider.cacheStore(), provider.metadataStore(), provider.mutationQueue(), remote,
            provider.dayBoundaryEngine(), retention, db.clock, db.settings);
        return true;
    }

    SyncSummary sync()
    {
        const auto result = service->triggerSyncNow();
        if (!result) {
            qWarning() << "sync failed:" << result.error().message;
            return {};
        }
        return result.value();
    }

    std::optional<Task> cached(int id) const { return db.provider.cacheStore()->task(id); }
    std::optional<Task> remoteTask(int id) const
    {
        const auto entity = remote->entity(EntityType::Task, id);
        if (!entity) {
            return std::nullopt;
        }
        return std::get<Task>(*entity);
    }
    planner::data::OfflineRepository &repository() { return db.provider.repository(); }

    TestDatabase db;
    std::shared_ptr<InMemoryRemoteService> remote;
    std::shared_ptr<RetentionPolicy> retention;
    std::unique_ptr<SyncService> service;
};
} // namespace

class SyncServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void offlineCreateIsPushedAndRemapped();
    void editsAfterCreateFollowTheNewId();
    void compactedPayloadIsRebuiltFromCache();
    void unchangedRemoteSetIsSkipped();
    void failureBlocksOnlyItsEntity();
    void unreachableRemoteStopsTheCycle();
    void offlineCycleStillRollsOver();
    void repeatedRejectionsPark();
    void remoteDeletionDeactivatesLocally();
    void confirmedDeleteDisablesTask();
    void olderRemoteRecordDoesNotOverwrite();
    void overlappingTriggerReportsAlreadyRunning();
    void cancelStopsBetweenItems();
    void statusChangesAreSignalled();
};

void SyncServiceTest::offlineCreateIsPushedAndRemapped()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());

    const auto created = fixture.repository().createTask(makeTask(0, QStringLiteral("New"), at(2024, 3, 10, 18, 0)));
    QVERIFY(created.isOk());
    QCOMPARE(created.value().id, -1);

    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushed, 1);
    QCOMPARE(summary.pushFailed, 0);
    QVERIFY(!fixture.cached(-1).has_value());

    const auto stored = fixture.cached(1000);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->title, QStringLiteral("New"));
    QVERIFY(fixture.remoteTask(1000).has_value());
    QCOMPARE(fixture.db.provider.mutationQueue()->countByStatus().pending, 0);
    QCOMPARE(fixture.db.provider.mutationQueue()->countByStatus().synced, 1);

    const SyncStatus status = fixture.service->status();
    QCOMPARE(status.state, SyncState::Idle);
    QCOMPARE(status.pendingItems, 0);
    QCOMPARE(status.lastSuccessfulSync, fixture.db.clock->nowMillis());
}

void SyncServiceTest::editsAfterCreateFollowTheNewId()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    auto &repository = fixture.repository();

    auto created = repository.createTask(makeTask(0, QStringLiteral("Draft"), at(2024, 3, 10, 18, 0)));
    QVERIFY(created.isOk());
    fixture.db.clock->advanceSecs(5);
    Task edited = created.value();
    edited.title = QStringLiteral("Final");
    QVERIFY(repository.updateTask(edited).isOk());
    QVERIFY(repository.completeTask(edited.id).isOk());

    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushFailed, 0);
    const auto remote = fixture.remoteTask(1000);
    QVERIFY(remote.has_value());
    QCOMPARE(remote->title, QStringLiteral("Final"));
    QVERIFY(remote->completed);
    QCOMPARE(fixture.cached(1000)->title, QStringLiteral("Final"));
    QCOMPARE(fixture.db.provider.cacheStore()->count(EntityType::Task), quint64(1));
}

void SyncServiceTest::compactedPayloadIsRebuiltFromCache()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    auto queue = fixture.db.provider.mutationQueue();

    QVERIFY(fixture.repository().createTask(makeTask(0, QStringLiteral("Large"), at(2024, 3, 11, 7, 0))).isOk());
    const auto compacted = queue->compact(0);
    QVERIFY(compacted.isOk());
    QCOMPARE(compacted.value(), 1);

    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushed, 1);
    const auto remote = fixture.remoteTask(1000);
    QVERIFY(remote.has_value());
    QCOMPARE(remote->title, QStringLiteral("Large"));
    QCOMPARE(remote->reminderTime, at(2024, 3, 11, 7, 0));
}

void SyncServiceTest::unchangedRemoteSetIsSkipped()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    fixture.remote->seed(makeTask(1, QStringLiteral("Remote"), at(2024, 3, 10, 8, 0)));

    SyncSummary first = fixture.sync();
    QCOMPARE(first.pulled, 1);
    QCOMPARE(first.unchangedTypes, 0);
    QVERIFY(fixture.cached(1).has_value());

    SyncSummary second = fixture.sync();
    QCOMPARE(second.pulled, 0);
    QCOMPARE(second.unchangedTypes, 3);

    fixture.db.clock->advanceSecs(60);
    Task changed = makeTask(1, QStringLiteral("Renamed"), at(2024, 3, 10, 8, 0));
    changed.updatedAt = fixture.db.clock->nowMillis();
    fixture.remote->seed(changed);

    SyncSummary third = fixture.sync();
    QCOMPARE(third.pulled, 1);
    QCOMPARE(third.unchangedTypes, 2);
    QCOMPARE(fixture.cached(1)->title, QStringLiteral("Renamed"));
}

void SyncServiceTest::failureBlocksOnlyItsEntity()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    fixture.remote->seed(makeTask(1, QStringLiteral("One"), at(2024, 3, 10, 8, 0)));
    fixture.remote->seed(makeTask(2, QStringLiteral("Two"), at(2024, 3, 10, 8, 0)));
    fixture.sync();
    fixture.db.clock->advanceSecs(10);

    auto &repository = fixture.repository();
    Task one = *fixture.cached(1);
    one.title = QStringLiteral("One edited");
    QVERIFY(repository.updateTask(one).isOk());
    QVERIFY(repository.completeTask(1).isOk());
    QVERIFY(repository.completeTask(2).isOk());

    fixture.remote->failNextTransient(1);
    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushed, 1);
    QCOMPARE(summary.pushFailed, 1);
    QVERIFY(summary.error.has_value());
    QCOMPARE(summary.error->kind, Error::Kind::TransientNetwork);
    QVERIFY(fixture.remoteTask(2)->completed);
    QVERIFY(!fixture.remoteTask(1)->completed);
    QCOMPARE(fixture.remoteTask(1)->title, QStringLiteral("One"));
    QCOMPARE(fixture.cached(1)->title, QStringLiteral("One edited"));
    QCOMPARE(fixture.service->status().state, SyncState::Error);
    QCOMPARE(fixture.service->status().pendingItems, 2);

    fixture.db.clock->advanceSecs(31);
    const SyncSummary retry = fixture.sync();
    QCOMPARE(retry.pushed, 2);
    QCOMPARE(retry.pushFailed, 0);
    QCOMPARE(fixture.remoteTask(1)->title, QStringLiteral("One edited"));
    QVERIFY(fixture.remoteTask(1)->completed);
    QCOMPARE(fixture.service->status().state, SyncState::Idle);
}

void SyncServiceTest::unreachableRemoteStopsTheCycle()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    QVERIFY(fixture.repository().createTask(makeTask(0, QStringLiteral("A"), at(2024, 3, 10, 18, 0))).isOk());
    QVERIFY(fixture.repository().createTask(makeTask(0, QStringLiteral("B"), at(2024, 3, 10, 19, 0))).isOk());

    fixture.remote->setOffline(true);
    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushed, 0);
    QCOMPARE(summary.pushFailed, 1);
    QCOMPARE(fixture.remote->listCalls(), 0);
    QVERIFY(summary.rollover.has_value());

    const SyncStatus status = fixture.service->status();
    QCOMPARE(status.state, SyncState::Error);
    QCOMPARE(status.lastErrorKind, std::optional<Error::Kind>(Error::Kind::TransientNetwork));
    QCOMPARE(status.lastSuccessfulSync, qint64(0));
    QCOMPARE(status.pendingItems, 2);
    QVERIFY(fixture.cached(-1).has_value());

    fixture.remote->setOffline(false);
    fixture.db.clock->advanceSecs(31);
    const SyncSummary recovered = fixture.sync();
    QCOMPARE(recovered.pushed, 2);
    QCOMPARE(fixture.service->status().state, SyncState::Idle);
    QVERIFY(fixture.remoteTask(1000).has_value());
    QVERIFY(fixture.remoteTask(1001).has_value());
}

void SyncServiceTest::offlineCycleStillRollsOver()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    QVERIFY(fixture.db.provider.dayBoundaryEngine()->runIfNewDay(fixture.db.clock->now(), 4).isOk());
    Task daily = planner::testing::makeDaily(1, QStringLiteral("Stretch"), at(2024, 3, 10, 8, 0));
    daily.completed = true;
    daily.updatedAt = 100;
    QVERIFY(fixture.db.provider.cacheStore()->upsert(daily).isOk());

    fixture.remote->setOffline(true);
    fixture.db.clock->setNow(at(2024, 3, 11, 10, 0));
    const SyncSummary summary = fixture.sync();
    QVERIFY(summary.rollover.has_value());
    QVERIFY(summary.rollover->newDay);
    QCOMPARE(summary.rollover->advanced, 1);
    QVERIFY(!fixture.cached(1)->completed);
    QCOMPARE(fixture.cached(1)->reminderTime, at(2024, 3, 11, 8, 0));
    QCOMPARE(fixture.service->status().state, SyncState::Error);
}

void SyncServiceTest::repeatedRejectionsPark()
{
    SyncSettings settings;
    settings.maxRejectedRetries = 2;
    SyncFixture fixture(settings);
    QVERIFY(fixture.open());
    fixture.remote->seed(makeTask(5, QStringLiteral("Disputed"), at(2024, 3, 10, 8, 0)));
    fixture.sync();
    fixture.db.clock->advanceSecs(10);

    QVERIFY(fixture.repository().completeTask(5).isOk());
    fixture.remote->rejectEntity(EntityType::Task, 5);

    SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushFailed, 1);
    QCOMPARE(summary.error->kind, Error::Kind::RemoteRejected);
    QCOMPARE(summary.error->statusCode, 422);
    QCOMPARE(summary.parked, 0);

    fixture.db.clock->advanceSecs(31);
    summary = fixture.sync();
    QCOMPARE(summary.pushFailed, 1);
    QCOMPARE(summary.parked, 1);

    fixture.db.clock->advanceSecs(3600);
    summary = fixture.sync();
    QCOMPARE(summary.pushFailed, 0);
    QCOMPARE(summary.pushed, 0);
    QCOMPARE(fixture.service->status().parkedItems, 1);
    QCOMPARE(fixture.service->status().pendingItems, 0);

    auto queue = fixture.db.provider.mutationQueue();
    QCOMPARE(queue->parkedItems().size(), size_t(1));
    fixture.remote->clearRejections();
    QCOMPARE(queue->resetParked().value(), 1);
    summary = fixture.sync();
    QCOMPARE(summary.pushed, 1);
    QVERIFY(fixture.remoteTask(5)->completed);
}

void SyncServiceTest::remoteDeletionDeactivatesLocally()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    fixture.remote->seed(makeTask(7, QStringLiteral("Gone soon"), at(2024, 3, 10, 8, 0)));
    User user;
    user.id = 3;
    user.name = QStringLiteral("Ana");
    user.status = QStringLiteral("active");
    fixture.remote->seed(user);
    Group group;
    group.id = 4;
    group.name = QStringLiteral("Flat");
    group.memberIds = {3};
    fixture.remote->seed(group);
    fixture.sync();
    QVERIFY(fixture.cached(7)->enabled);

    QVERIFY(fixture.remote->removeEntity(EntityType::Task, 7));
    QVERIFY(fixture.remote->removeEntity(EntityType::User, 3));
    QVERIFY(fixture.remote->removeEntity(EntityType::Group, 4));
    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.deactivated, 3);

    const auto task = fixture.cached(7);
    QVERIFY(task.has_value());
    QVERIFY(!task->enabled);
    const auto cache = fixture.db.provider.cacheStore();
    const auto storedUser = cache->get(EntityType::User, 3);
    QVERIFY(storedUser.has_value());
    QCOMPARE(std::get<User>(*storedUser).status, QStringLiteral("inactive"));
    QVERIFY(!cache->get(EntityType::Group, 4).has_value());
}

void SyncServiceTest::confirmedDeleteDisablesTask()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    fixture.remote->seed(makeTask(8, QStringLiteral("Obsolete"), at(2024, 3, 10, 8, 0)));
    fixture.sync();
    fixture.db.clock->advanceSecs(10);

    QVERIFY(fixture.repository().deleteTask(8).isOk());
    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushed, 1);
    QVERIFY(!fixture.remoteTask(8).has_value());

    const auto task = fixture.cached(8);
    QVERIFY(task.has_value());
    QVERIFY(!task->enabled);
    QVERIFY(!fixture.db.provider.mutationQueue()->hasOutstanding(EntityType::Task, 8));
}

void SyncServiceTest::olderRemoteRecordDoesNotOverwrite()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    fixture.remote->seed(makeTask(9, QStringLiteral("Remote"), at(2024, 3, 10, 8, 0)));
    fixture.sync();
    fixture.db.clock->advanceSecs(10);

    Task local = *fixture.cached(9);
    local.title = QStringLiteral("Local");
    QVERIFY(fixture.repository().updateTask(local).isOk());
    fixture.remote->setOffline(true);
    fixture.sync();
    fixture.remote->setOffline(false);

    // The failed edit is backing off, so this cycle only pulls.
    fixture.remote->seed(makeTask(10, QStringLiteral("Other"), at(2024, 3, 10, 8, 0)));
    const SyncSummary summary = fixture.sync();
    QCOMPARE(summary.pushed, 0);
    QCOMPARE(summary.pushFailed, 0);
    QCOMPARE(summary.pulled, 1);
    QVERIFY(fixture.cached(10).has_value());
    QCOMPARE(fixture.cached(9)->title, QStringLiteral("Local"));
    QCOMPARE(fixture.remoteTask(9)->title, QStringLiteral("Remote"));
}

void SyncServiceTest::overlappingTriggerReportsAlreadyRunning()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());

    std::optional<SyncSummary> nested;
    connect(fixture.service.get(), &SyncService::syncStatusChanged, this, [&](const SyncStatus &status) {
        if (status.state == SyncState::Syncing && !nested) {
            const auto result = fixture.service->triggerSyncNow();
            QVERIFY(result.isOk());
            nested = result.value();
        }
    });

    const SyncSummary outer = fixture.sync();
    QVERIFY(!outer.alreadyRunning);
    QVERIFY(nested.has_value());
    QVERIFY(nested->alreadyRunning);

    const auto again = fixture.service->triggerSyncNow();
    QVERIFY(again.isOk());
    QVERIFY(!again.value().alreadyRunning);
}

void SyncServiceTest::cancelStopsBetweenItems()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    QVERIFY(fixture.repository().createTask(makeTask(0, QStringLiteral("A"), at(2024, 3, 10, 18, 0))).isOk());

    connect(fixture.service.get(), &SyncService::syncStatusChanged, this, [&](const SyncStatus &status) {
        if (status.state == SyncState::Syncing) {
            fixture.service->requestCancel();
        }
    });

    const SyncSummary summary = fixture.sync();
    QVERIFY(summary.cancelled);
    QCOMPARE(summary.pushed, 0);
    QCOMPARE(fixture.remote->listCalls(), 0);
    QCOMPARE(fixture.service->status().lastSuccessfulSync, qint64(0));
    QCOMPARE(fixture.db.provider.mutationQueue()->countByStatus().pending, 1);
}

void SyncServiceTest::statusChangesAreSignalled()
{
    SyncFixture fixture;
    QVERIFY(fixture.open());
    QSignalSpy spy(fixture.service.get(), &SyncService::syncStatusChanged);
    QVERIFY(spy.isValid());

    QVERIFY(fixture.repository().createTask(makeTask(0, QStringLiteral("A"), at(2024, 3, 10, 18, 0))).isOk());
    fixture.sync();

    QCOMPARE(spy.count(), 2);
    const auto syncing = spy.at(0).at(0).value<SyncStatus>();
    QCOMPARE(syncing.state, SyncState::Syncing);
    QCOMPARE(syncing.pendingItems, 1);
    const auto idle = spy.at(1).at(0).value<SyncStatus>();
    QCOMPARE(idle.state, SyncState::Idle);
    QCOMPARE(idle.pendingItems, 0);
    QVERIFY(!idle.lastErrorKind.has_value());
}

QTEST_GUILESS_MAIN(SyncServiceTest)
#include "SyncServiceTest.moc"
