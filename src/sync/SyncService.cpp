#include "planner/sync/SyncService.hpp"

#include <QMutexLocker>
#include <QSet>

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/EntityCodec.hpp"
#include "planner/data/LocalDatabase.hpp"
#include "planner/data/MetadataStore.hpp"
#include "planner/data/MutationQueue.hpp"
#include "planner/sync/HashCalculator.hpp"

namespace planner {
namespace sync {

namespace {
constexpr auto kInactiveStatus = "inactive";

qint64 lastAccessedOf(const data::Entity &entity)
{
    return std::visit([](const auto &value) { return value.lastAccessed; }, entity);
}

// Clears the running flag on every exit path.
class RunningFlag
{
public:
    explicit RunningFlag(std::atomic_bool &flag)
        : m_flag(flag)
    {
    }
    ~RunningFlag() { m_flag = false; }

private:
    std::atomic_bool &m_flag;
};
} // namespace

QString syncStateToString(SyncState state)
{
    switch (state) {
    case SyncState::Syncing:
        return QStringLiteral("syncing");
    case SyncState::Error:
        return QStringLiteral("error");
    case SyncState::Idle:
    default:
        return QStringLiteral("idle");
    }
}

SyncService::SyncService(std::shared_ptr<data::CacheStore> cache, std::shared_ptr<data::MetadataStore> metadata,
                         std::shared_ptr<data::MutationQueue> queue, std::shared_ptr<RemoteService> remote,
                         std::shared_ptr<core::DayBoundaryEngine> dayBoundary,
                         std::shared_ptr<RetentionPolicy> retention, std::shared_ptr<core::Clock> clock,
                         const core::SettingsSource &settings, QObject *parent)
    : QObject(parent)
    , m_cache(std::move(cache))
    , m_metadata(std::move(metadata))
    , m_queue(std::move(queue))
    , m_remote(std::move(remote))
    , m_dayBoundary(std::move(dayBoundary))
    , m_retention(std::move(retention))
    , m_clock(std::move(clock))
    , m_settings(settings)
{
    qRegisterMetaType<planner::sync::SyncStatus>("planner::sync::SyncStatus");
    m_status.lastSuccessfulSync =
        m_metadata->integer(QString::fromLatin1(data::metadata_keys::LastSuccessfulSync)).value_or(0);
}

SyncService::~SyncService() = default;

core::Result<SyncSummary> SyncService::triggerSyncNow()
{
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        qCDebug(lcSync) << "Sync already running";
        SyncSummary summary;
        summary.alreadyRunning = true;
        return core::Result<SyncSummary>::ok(summary);
    }
    RunningFlag running(m_running);
    m_cancelRequested = false;

    const core::SyncSettings settings = m_settings.current();
    m_queue->setPolicy(data::QueuePolicy::fromSettings(settings));
    m_retention->setCeilingBytes(settings.retentionCeilingBytes);
    m_retention->setInactiveRetentionDays(settings.inactiveRetentionDays);

    {
        QMutexLocker locker(&m_statusMutex);
        m_status.lastErrorKind.reset();
        m_status.lastErrorMessage.clear();
    }
    publish(SyncState::Syncing);

    SyncSummary summary;
    const auto pushed = push(settings.batchSize, summary);
    m_queue->releaseLeases();
    if (!pushed) {
        recordFailure(pushed.error(), summary);
        publish(SyncState::Error);
        return core::Result<SyncSummary>::fail(pushed.error());
    }
    bool reachable = pushed.value();

    const auto garbage = m_queue->collectGarbage();
    if (!garbage) {
        qCWarning(lcSync) << "Queue garbage collection failed:" << garbage.error().message;
    }

    if (reachable && !summary.cancelled) {
        const auto pulled = pull(summary);
        if (!pulled) {
            recordFailure(pulled.error(), summary);
            publish(SyncState::Error);
            return core::Result<SyncSummary>::fail(pulled.error());
        }
        reachable = pulled.value();
    }

    // Rollover and retention are local and run while offline too.
    if (!summary.cancelled) {
        const auto rollover = m_dayBoundary->runIfNewDay(m_clock->now(), settings.dayStartHour);
        if (!rollover) {
            recordFailure(rollover.error(), summary);
            publish(SyncState::Error);
            return core::Result<SyncSummary>::fail(rollover.error());
        }
        summary.rollover = rollover.value();
        summary.retention = m_retention->run();
    }

    summary.parked = m_queue->countByStatus().parked;
    if (reachable && !summary.cancelled && summary.pushFailed == 0) {
        const qint64 now = m_clock->nowMillis();
        const auto stored = m_metadata->setInteger(QString::fromLatin1(data::metadata_keys::LastSuccessfulSync), now);
        if (!stored) {
            qCWarning(lcSync) << "Cannot record last successful sync:" << stored.error().message;
        }
        QMutexLocker locker(&m_statusMutex);
        m_status.lastSuccessfulSync = now;
    }

    qCInfo(lcSync) << "Sync finished: pushed" << summary.pushed << "failed" << summary.pushFailed << "pulled"
                   << summary.pulled << "unchanged types" << summary.unchangedTypes << "deactivated"
                   << summary.deactivated << (summary.cancelled ? "(cancelled)" : "");
    publish(summary.error || summary.pushFailed > 0 ? SyncState::Error : SyncState::Idle);
    return core::Result<SyncSummary>::ok(summary);
}

void SyncService::requestCancel()
{
    m_cancelRequested = true;
}

SyncStatus SyncService::status() const
{
    QMutexLocker locker(&m_statusMutex);
    return m_status;
}

core::Result<bool> SyncService::push(int batchSize, SyncSummary &summary)
{
    const std::vector<data::QueueItem> batch = m_queue->drainPending(batchSize);
    if (batch.empty()) {
        return core::Result<bool>::ok(true);
    }
    qCDebug(lcSync) << "Pushing" << batch.size() << "queued operations";

    QSet<data::EntityKey> blocked;
    for (const data::QueueItem &leased : batch) {
        if (m_cancelRequested) {
            qCInfo(lcSync) << "Push cancelled";
            summary.cancelled = true;
            break;
        }
        // Re-read: an earlier create in this batch may have remapped the entity id.
        const data::QueueItem item = m_queue->item(leased.id).value_or(leased);
        const data::EntityKey key{item.entityType, leased.effectiveId()};
        if (blocked.contains(key)) {
            continue;
        }

        auto operation = buildOperation(item);
        core::Result<RemoteAck> ack = operation ? m_remote->applyOperation(operation.value())
                                                : core::Result<RemoteAck>::fail(core::Error::remoteRejected(
                                                      0, operation.error().message));
        if (!ack) {
            const core::Error &error = ack.error();
            const auto outcome = error.kind == core::Error::Kind::TransientNetwork ? data::QueueOutcome::TransientFailure
                                                                                   : data::QueueOutcome::Rejected;
            qCWarning(lcSync) << data::queueOperationToString(item.operation)
                              << data::entityTypeToString(item.entityType) << item.effectiveId() << "failed:"
                              << core::errorKindName(error.kind) << error.message;
            const auto marked = m_queue->markResult(item.id, outcome);
            if (!marked) {
                return marked;
            }
            blocked.insert(key);
            ++summary.pushFailed;
            recordFailure(error, summary);
            if (error.kind == core::Error::Kind::TransientNetwork && error.statusCode == 0) {
                qCInfo(lcSync) << "Remote unreachable, stopping push";
                return core::Result<bool>::ok(false);
            }
            continue;
        }

        const auto applied = applyAck(item, ack.value());
        if (!applied) {
            return applied;
        }
        const auto marked = m_queue->markResult(item.id, data::QueueOutcome::Synced);
        if (!marked) {
            return marked;
        }
        ++summary.pushed;
    }
    return core::Result<bool>::ok(true);
}

core::Result<bool> SyncService::pull(SyncSummary &summary)
{
    for (const data::EntityType type : data::kAllEntityTypes) {
        if (m_cancelRequested) {
            summary.cancelled = true;
            return core::Result<bool>::ok(true);
        }
        const auto remote = m_remote->listEntities(type);
        if (!remote) {
            qCWarning(lcSync) << "Pull of" << data::entityTypeToString(type) << "failed:" << remote.error().message;
            recordFailure(remote.error(), summary);
            return core::Result<bool>::ok(false);
        }
        const auto merged = mergeType(type, remote.value(), summary);
        if (!merged) {
            return merged;
        }
    }
    return core::Result<bool>::ok(true);
}

core::Result<bool> SyncService::mergeType(data::EntityType type, const std::vector<data::Entity> &remote,
                                          SyncSummary &summary)
{
    const QString hashKey = data::metadata_keys::lastPullHash(type);
    const QString hash = HashCalculator::setHash(remote);
    if (m_metadata->value(hashKey) == hash) {
        qCDebug(lcSync) << "Remote" << data::entityTypeToString(type) << "set unchanged";
        ++summary.unchangedTypes;
        return core::Result<bool>::ok(true);
    }

    data::TransactionGuard transaction(m_cache->database());
    if (!transaction.isActive()) {
        return core::Result<bool>::fail(core::Error::storage(QStringLiteral("cannot start pull transaction")));
    }

    const auto applied = m_cache->upsert(remote);
    if (!applied) {
        return core::Result<bool>::fail(applied.error());
    }
    summary.pulled += applied.value();

    QSet<int> remoteIds;
    for (const data::Entity &entity : remote) {
        remoteIds.insert(data::entityId(entity));
    }

    std::vector<data::Entity> missing;
    for (const data::Entity &cached : m_cache->listByType(type)) {
        const int id = data::entityId(cached);
        if (id <= 0 || remoteIds.contains(id) || m_queue->hasOutstanding(type, id)) {
            continue;
        }
        if (type == data::EntityType::Group) {
            const auto removed = m_cache->remove(type, id);
            if (!removed) {
                return removed;
            }
            ++summary.deactivated;
            continue;
        }
        if (auto inactive = deactivated(cached)) {
            missing.push_back(std::move(*inactive));
        }
    }
    const auto written = m_cache->upsert(missing);
    if (!written) {
        return core::Result<bool>::fail(written.error());
    }
    summary.deactivated += written.value();

    const auto stored = m_metadata->setValue(hashKey, hash);
    if (!stored) {
        return stored;
    }
    if (!transaction.commit()) {
        return core::Result<bool>::fail(core::Error::storage(QStringLiteral("pull commit failed")));
    }
    qCDebug(lcSync) << "Merged" << applied.value() << data::entityTypeToString(type) << "records, deactivated"
                    << missing.size();
    return core::Result<bool>::ok(true);
}

core::Result<RemoteOperation> SyncService::buildOperation(const data::QueueItem &item) const
{
    RemoteOperation operation;
    operation.operation = item.operation;
    operation.entityType = item.entityType;
    operation.entityId = item.entityId;
    operation.localId = item.localId;
    operation.timestamp = item.timestamp;
    operation.queueItemId = item.id;

    if (item.operation != data::QueueOperation::Create && !item.entityId) {
        return core::Result<RemoteOperation>::fail(
            core::Error::validation(QStringLiteral("entity %1 has no remote id yet").arg(item.effectiveId())));
    }

    if (item.payload) {
        operation.payload = *item.payload;
    } else if (item.operation == data::QueueOperation::Create || item.operation == data::QueueOperation::Update) {
        const auto cached = m_cache->get(item.entityType, item.effectiveId());
        if (!cached) {
            return core::Result<RemoteOperation>::fail(core::Error::validation(
                QStringLiteral("compacted payload for %1 %2 cannot be rebuilt")
                    .arg(data::entityTypeToString(item.entityType))
                    .arg(item.effectiveId())));
        }
        operation.payload = data::EntityCodec::toPayload(*cached, item.entityId.has_value());
    }
    return core::Result<RemoteOperation>::ok(operation);
}

core::Result<bool> SyncService::applyAck(const data::QueueItem &item, const RemoteAck &ack)
{
    if (item.operation == data::QueueOperation::Delete) {
        return applyConfirmedDelete(item.entityType, item.effectiveId());
    }
    if (!ack.entity) {
        return core::Result<bool>::ok(true);
    }

    data::Entity remote = *ack.entity;
    const int localKey = item.effectiveId();
    data::TransactionGuard transaction(m_cache->database());
    if (!transaction.isActive()) {
        return core::Result<bool>::fail(core::Error::storage(QStringLiteral("cannot start ack transaction")));
    }

    // Later local edits still queued for this entity win in the cache until they are pushed.
    const bool moreQueued = m_queue->outstandingFor(item.entityType, localKey).size() > 1;
    const auto local = m_cache->get(item.entityType, localKey);
    if (local) {
        setEntityLastAccessed(remote, lastAccessedOf(*local));
    }

    if (item.operation == data::QueueOperation::Create && localKey < 0) {
        const int remoteId = data::entityId(remote);
        if (moreQueued && local) {
            data::Entity rekeyed = *local;
            setEntityId(rekeyed, remoteId);
            remote = rekeyed;
        }
        const auto removed = m_cache->remove(item.entityType, localKey);
        if (!removed) {
            return removed;
        }
        const auto written = m_cache->upsert(remote);
        if (!written) {
            return core::Result<bool>::fail(written.error());
        }
        const auto remapped = m_queue->remapLocalId(item.entityType, localKey, remoteId);
        if (!remapped) {
            return core::Result<bool>::fail(remapped.error());
        }
        qCDebug(lcSync) << "Local" << data::entityTypeToString(item.entityType) << localKey << "is now" << remoteId;
    } else if (!moreQueued) {
        const auto written = m_cache->upsert(remote);
        if (!written) {
            return core::Result<bool>::fail(written.error());
        }
    }

    if (!transaction.commit()) {
        return core::Result<bool>::fail(core::Error::storage(QStringLiteral("ack commit failed")));
    }
    return core::Result<bool>::ok(true);
}

core::Result<bool> SyncService::applyConfirmedDelete(data::EntityType type, int id)
{
    const auto cached = m_cache->get(type, id);
    if (!cached) {
        return core::Result<bool>::ok(true);
    }
    if (type != data::EntityType::Task) {
        return m_cache->remove(type, id);
    }
    if (auto inactive = deactivated(*cached)) {
        const auto written = m_cache->upsert(*inactive);
        if (!written) {
            return core::Result<bool>::fail(written.error());
        }
    }
    return core::Result<bool>::ok(true);
}

std::optional<data::Entity> SyncService::deactivated(const data::Entity &entity) const
{
    if (const auto *task = std::get_if<data::Task>(&entity)) {
        if (!task->enabled) {
            return std::nullopt;
        }
        data::Task copy = *task;
        copy.enabled = false;
        copy.lastAccessed = 0;
        return data::Entity(copy);
    }
    if (const auto *user = std::get_if<data::User>(&entity)) {
        if (user->status == QLatin1String(kInactiveStatus)) {
            return std::nullopt;
        }
        data::User copy = *user;
        copy.status = QString::fromLatin1(kInactiveStatus);
        copy.lastAccessed = 0;
        return data::Entity(copy);
    }
    return std::nullopt;
}

void SyncService::recordFailure(const core::Error &error, SyncSummary &summary)
{
    if (error.kind != core::Error::Kind::RemoteRejected || !summary.error) {
        summary.error = error;
    }
    QMutexLocker locker(&m_statusMutex);
    m_status.lastErrorKind = error.kind;
    m_status.lastErrorMessage = error.message;
}

void SyncService::publish(SyncState state)
{
    const data::QueueCounts counts = m_queue->countByStatus();
    SyncStatus snapshot;
    {
        QMutexLocker locker(&m_statusMutex);
        m_status.state = state;
        m_status.pendingItems = counts.pending + counts.failed - counts.parked;
        m_status.parkedItems = counts.parked;
        snapshot = m_status;
    }
    emit syncStatusChanged(snapshot);
}

} // namespace sync
} // namespace planner
