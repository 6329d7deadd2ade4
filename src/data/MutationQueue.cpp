#include "planner/data/MutationQueue.hpp"

#include <QHash>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSqlQuery>

#include <algorithm>
#include <limits>
#include <map>
#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/LocalDatabase.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto ITEM_COLUMNS =
    "id, operation, entity_type, entity_id, local_id, payload, timestamp, retry_count, last_retry, status, "
    "last_error, synced_at, size_bytes, leased_at";
// A lease older than this belongs to a process that died mid-push.
constexpr qint64 kLeaseExpiryMillis = 15 * 60 * 1000;
constexpr auto ENTITY_MATCH =
    "entity_type = :type AND (entity_id = :key OR (entity_id IS NULL AND local_id = :local))";

QVariant nullableInt(const std::optional<int> &value)
{
    return value.has_value() ? QVariant(*value) : QVariant(QVariant::Int);
}

QString payloadText(const std::optional<QJsonObject> &payload)
{
    if (!payload.has_value()) {
        return QString();
    }
    return QString::fromUtf8(QJsonDocument(*payload).toJson(QJsonDocument::Compact));
}

QVariant payloadVariant(const std::optional<QJsonObject> &payload)
{
    return payload.has_value() ? QVariant(payloadText(payload)) : QVariant(QVariant::String);
}

std::optional<QueueItem> itemFromRow(const QSqlQuery &query)
{
    const auto operation = queueOperationFromString(query.value(1).toString());
    const auto type = entityTypeFromString(query.value(2).toString());
    const auto status = queueStatusFromString(query.value(9).toString());
    if (!operation || !type || !status) {
        qCWarning(lcQueue) << "Skipping malformed queue row" << query.value(0).toLongLong();
        return std::nullopt;
    }

    QueueItem item;
    item.id = query.value(0).toLongLong();
    item.operation = *operation;
    item.entityType = *type;
    if (!query.value(3).isNull()) {
        item.entityId = query.value(3).toInt();
    }
    if (!query.value(4).isNull()) {
        item.localId = query.value(4).toInt();
    }
    if (!query.value(5).isNull()) {
        const QJsonDocument document = QJsonDocument::fromJson(query.value(5).toString().toUtf8());
        if (document.isObject()) {
            item.payload = document.object();
        }
    }
    item.timestamp = query.value(6).toLongLong();
    item.retryCount = query.value(7).toInt();
    if (!query.value(8).isNull()) {
        item.lastRetry = query.value(8).toLongLong();
    }
    item.status = *status;
    if (!query.value(10).isNull()) {
        item.lastError = errorKindFromName(query.value(10).toString());
    }
    if (!query.value(11).isNull()) {
        item.syncedAt = query.value(11).toLongLong();
    }
    item.sizeBytes = query.value(12).toLongLong();
    if (!query.value(13).isNull()) {
        item.leasedAt = query.value(13).toLongLong();
    }
    return item;
}

QVariantMap entityBindings(EntityType type, int key)
{
    return {
        {QStringLiteral(":type"), entityTypeToString(type)},
        {QStringLiteral(":key"), key},
        {QStringLiteral(":local"), key},
    };
}

bool isToggle(QueueOperation operation)
{
    return operation == QueueOperation::Complete || operation == QueueOperation::Uncomplete;
}
} // namespace

QueuePolicy QueuePolicy::fromSettings(const core::SyncSettings &settings)
{
    QueuePolicy policy;
    policy.maxRejectedRetries = settings.maxRejectedRetries;
    policy.backoffBaseSeconds = settings.backoffBaseSeconds;
    policy.backoffMaxSeconds = settings.backoffMaxSeconds;
    policy.syncedRetentionHours = settings.syncedRetentionHours;
    policy.ceilingBytes = settings.queueCeilingBytes;
    return policy;
}

MutationQueue::MutationQueue(std::shared_ptr<LocalDatabase> database, std::shared_ptr<core::Clock> clock,
                             QueuePolicy policy)
    : m_database(std::move(database))
    , m_clock(std::move(clock))
    , m_policy(policy)
{
}

void MutationQueue::setPolicy(const QueuePolicy &policy)
{
    QMutexLocker locker(&m_leaseMutex);
    m_policy = policy;
}

QueuePolicy MutationQueue::policy() const
{
    QMutexLocker locker(&m_leaseMutex);
    return m_policy;
}

core::Result<QueueItem> MutationQueue::enqueue(QueueOperation operation, EntityType type,
                                               std::optional<int> entityId, std::optional<QJsonObject> payload,
                                               std::optional<int> localId)
{
    if (!entityId.has_value() && !localId.has_value()) {
        return core::Result<QueueItem>::fail(
            core::Error::validation(QStringLiteral("queue item needs an entity id or a local id")));
    }
    const int key = entityId.has_value() ? *entityId : *localId;

    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<QueueItem>::fail(core::Error::storage(QStringLiteral("cannot start queue transaction")));
    }

    const std::vector<QueueItem> outstanding = outstandingFor(type, key);
    for (const QueueItem &existing : outstanding) {
        if (existing.operation == QueueOperation::Delete) {
            return core::Result<QueueItem>::fail(core::Error::validation(
                QStringLiteral("%1 %2 is already queued for deletion").arg(entityTypeToString(type)).arg(key)));
        }
    }

    QueueItem queued;
    queued.operation = operation;
    queued.entityType = type;
    queued.entityId = entityId;
    queued.localId = localId;
    queued.payload = std::move(payload);
    queued.timestamp = m_clock->nowMillis();
    queued.status = QueueStatus::Pending;
    queued.sizeBytes = estimateQueueItemSize(queued.payload);

    std::optional<QueueItem> stored;
    if (operation == QueueOperation::Delete) {
        std::vector<QueueItem> superseded;
        for (const QueueItem &existing : outstanding) {
            if (!isLeased(existing)) {
                superseded.push_back(existing);
            }
        }
        const auto dropped = deleteItems(superseded);
        if (!dropped) {
            return core::Result<QueueItem>::fail(dropped.error());
        }
        if (dropped.value() > 0) {
            qCDebug(lcQueue) << "Delete of" << entityTypeToString(type) << key << "superseded" << dropped.value()
                             << "items";
        }
    } else if (!outstanding.empty()) {
        QueueItem newest = outstanding.back();
        const bool foldable = !isLeased(newest) && newest.status == QueueStatus::Pending;
        if (foldable && newest.operation == QueueOperation::Create) {
            if (newest.payload.has_value()) {
                if (operation == QueueOperation::Update && queued.payload.has_value()) {
                    QJsonObject merged = *newest.payload;
                    for (auto it = queued.payload->constBegin(); it != queued.payload->constEnd(); ++it) {
                        if (it.key() != QLatin1String("id")) {
                            merged.insert(it.key(), it.value());
                        }
                    }
                    newest.payload = merged;
                } else if (isToggle(operation)) {
                    newest.payload->insert(QStringLiteral("completed"), operation == QueueOperation::Complete);
                }
            }
            if (operation == QueueOperation::Update || isToggle(operation)) {
                newest.sizeBytes = estimateQueueItemSize(newest.payload);
                const auto updated = updatePayload(newest);
                if (!updated) {
                    return core::Result<QueueItem>::fail(updated.error());
                }
                stored = newest;
            }
        } else if (foldable && newest.operation == QueueOperation::Update && operation == QueueOperation::Update) {
            newest.payload = queued.payload;
            newest.sizeBytes = queued.sizeBytes;
            const auto updated = updatePayload(newest);
            if (!updated) {
                return core::Result<QueueItem>::fail(updated.error());
            }
            stored = newest;
        } else if (foldable && isToggle(newest.operation) && isToggle(operation)) {
            const auto updated = updateOperation(newest.id, operation);
            if (!updated) {
                return core::Result<QueueItem>::fail(updated.error());
            }
            newest.operation = operation;
            stored = newest;
        }
    }

    if (!stored.has_value()) {
        auto inserted = insertItem(queued);
        if (!inserted) {
            return inserted;
        }
        stored = inserted.value();
    } else {
        qCDebug(lcQueue) << "Coalesced" << queueOperationToString(operation) << "into item" << stored->id;
    }

    const quint64 ceiling = policy().ceilingBytes;
    if (pendingSizeBytes() > ceiling) {
        const auto compacted = compact(ceiling);
        if (!compacted) {
            return core::Result<QueueItem>::fail(compacted.error());
        }
        if (const auto refreshed = item(stored->id)) {
            stored = refreshed;
        }
    }

    if (!transaction.commit()) {
        return core::Result<QueueItem>::fail(core::Error::storage(QStringLiteral("queue commit failed")));
    }
    return core::Result<QueueItem>::ok(*stored);
}

std::vector<QueueItem> MutationQueue::drainPending(int limit)
{
    if (limit <= 0) {
        return {};
    }

    const qint64 now = m_clock->nowMillis();
    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        qCWarning(lcQueue) << "Cannot start drain transaction";
        return {};
    }
    const std::vector<QueueItem> outstanding = allOutstanding();

    // Group per entity in enqueue order; an entity whose oldest item is in
    // flight, parked or backing off contributes nothing.
    QHash<EntityKey, std::vector<QueueItem>> groups;
    std::vector<EntityKey> groupOrder;
    for (const QueueItem &candidate : outstanding) {
        const EntityKey key{candidate.entityType, candidate.effectiveId()};
        auto it = groups.find(key);
        if (it == groups.end()) {
            it = groups.insert(key, {});
            groupOrder.push_back(key);
        }
        it.value().push_back(candidate);
    }

    std::vector<QueueItem> selected;
    for (const EntityKey &key : groupOrder) {
        const std::vector<QueueItem> &items = groups[key];
        const QueueItem &oldest = items.front();
        bool blocked = !isEligible(oldest, now);
        for (const QueueItem &entry : items) {
            blocked = blocked || isLeased(entry);
        }
        if (blocked) {
            continue;
        }
        selected.insert(selected.end(), items.begin(), items.end());
    }

    std::stable_sort(selected.begin(), selected.end(), [](const QueueItem &lhs, const QueueItem &rhs) {
        const int lhsClass = isLightOperation(lhs.operation) ? 0 : 1;
        const int rhsClass = isLightOperation(rhs.operation) ? 0 : 1;
        if (lhsClass != rhsClass) {
            return lhsClass < rhsClass;
        }
        if (lhs.timestamp != rhs.timestamp) {
            return lhs.timestamp < rhs.timestamp;
        }
        return lhs.id < rhs.id;
    });

    // Each entity keeps the slots the priority sort gave it, filled in enqueue order.
    std::map<std::pair<int, int>, std::vector<size_t>> slots;
    std::map<std::pair<int, int>, std::vector<QueueItem>> fifo;
    for (size_t i = 0; i < selected.size(); ++i) {
        const auto key = std::make_pair(static_cast<int>(selected[i].entityType), selected[i].effectiveId());
        slots[key].push_back(i);
        fifo[key].push_back(selected[i]);
    }
    std::vector<QueueItem> ordered(selected.size());
    for (auto &entry : fifo) {
        std::vector<QueueItem> &items = entry.second;
        std::sort(items.begin(), items.end(), [](const QueueItem &lhs, const QueueItem &rhs) {
            return lhs.id < rhs.id;
        });
        const std::vector<size_t> &positions = slots[entry.first];
        for (size_t i = 0; i < items.size(); ++i) {
            ordered[positions[i]] = items[i];
        }
    }

    if (ordered.size() > static_cast<size_t>(limit)) {
        ordered.resize(static_cast<size_t>(limit));
    }

    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE sync_queue SET leased_at = :now WHERE id = :id"));
    query.bindValue(QStringLiteral(":now"), now);
    for (QueueItem &leased : ordered) {
        query.bindValue(QStringLiteral(":id"), leased.id);
        if (!query.exec()) {
            LocalDatabase::queryError(query, QStringLiteral("lease queue item"));
            return {};
        }
        leased.leasedAt = now;
    }
    if (!transaction.commit()) {
        qCWarning(lcQueue) << "Drain commit failed, nothing leased";
        return {};
    }

    QMutexLocker locker(&m_leaseMutex);
    for (const QueueItem &leased : ordered) {
        m_leases.insert(leased.id);
    }
    qCDebug(lcQueue) << "Drained" << ordered.size() << "of" << outstanding.size() << "outstanding items";
    return ordered;
}

core::Result<bool> MutationQueue::markResult(qint64 id, QueueOutcome outcome)
{
    // The in-memory lease goes only after the row left its leased state.
    WriteGuard guard(*m_database);
    auto result = writeResult(id, outcome);
    QMutexLocker locker(&m_leaseMutex);
    m_leases.remove(id);
    return result;
}

core::Result<bool> MutationQueue::writeResult(qint64 id, QueueOutcome outcome)
{
    const auto existing = item(id);
    if (!existing) {
        qCWarning(lcQueue) << "markResult for unknown item" << id;
        return core::Result<bool>::ok(false);
    }
    if (existing->status == QueueStatus::Synced) {
        return core::Result<bool>::ok(outcome == QueueOutcome::Synced);
    }

    const qint64 now = m_clock->nowMillis();
    QSqlQuery query(m_database->connection());
    if (outcome == QueueOutcome::Synced) {
        query.prepare(QStringLiteral("UPDATE sync_queue SET status = 'synced', synced_at = :now, last_error = NULL, "
                                     "leased_at = NULL WHERE id = :id"));
        query.bindValue(QStringLiteral(":now"), now);
    } else {
        const core::Error::Kind kind = outcome == QueueOutcome::Rejected ? core::Error::Kind::RemoteRejected
                                                                         : core::Error::Kind::TransientNetwork;
        query.prepare(QStringLiteral("UPDATE sync_queue SET status = 'failed', retry_count = retry_count + 1, "
                                     "last_retry = :now, last_error = :error, leased_at = NULL WHERE id = :id"));
        query.bindValue(QStringLiteral(":now"), now);
        query.bindValue(QStringLiteral(":error"), core::errorKindName(kind));
    }
    query.bindValue(QStringLiteral(":id"), id);
    if (!query.exec()) {
        return core::Result<bool>::fail(LocalDatabase::queryError(query, QStringLiteral("mark result")));
    }

    if (outcome == QueueOutcome::Rejected && existing->retryCount + 1 >= policy().maxRejectedRetries) {
        qCWarning(lcQueue) << "Item" << id << queueOperationToString(existing->operation)
                           << entityTypeToString(existing->entityType) << existing->effectiveId()
                           << "parked after" << existing->retryCount + 1 << "rejections";
    }
    return core::Result<bool>::ok(true);
}

quint64 MutationQueue::pendingSizeBytes() const
{
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    if (!query.exec(QStringLiteral("SELECT COALESCE(SUM(size_bytes), 0) FROM sync_queue WHERE status != 'synced'"))
        || !query.next()) {
        LocalDatabase::queryError(query, QStringLiteral("pending size"));
        return 0;
    }
    return query.value(0).toULongLong();
}

core::Result<int> MutationQueue::clear()
{
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    if (!query.exec(QStringLiteral("DELETE FROM sync_queue"))) {
        return core::Result<int>::fail(LocalDatabase::queryError(query, QStringLiteral("clear queue")));
    }
    releaseLeases();
    return core::Result<int>::ok(query.numRowsAffected());
}

std::optional<QueueItem> MutationQueue::item(qint64 id) const
{
    const auto items = selectItems(QStringLiteral("id = :id"), {{QStringLiteral(":id"), id}});
    if (items.empty()) {
        return std::nullopt;
    }
    return items.front();
}

std::vector<QueueItem> MutationQueue::outstandingFor(EntityType type, int key) const
{
    return selectItems(QStringLiteral("status != 'synced' AND %1").arg(QString::fromLatin1(ENTITY_MATCH)),
                       entityBindings(type, key));
}

bool MutationQueue::hasOutstanding(EntityType type, int key) const
{
    return !outstandingFor(type, key).empty();
}

bool MutationQueue::hasLeased(EntityType type, int key) const
{
    for (const QueueItem &entry : outstandingFor(type, key)) {
        if (isLeased(entry)) {
            return true;
        }
    }
    return false;
}

core::Result<int> MutationQueue::discardOutstanding(EntityType type, int key)
{
    WriteGuard guard(*m_database);
    std::vector<QueueItem> discarded;
    for (const QueueItem &entry : outstandingFor(type, key)) {
        if (!isLeased(entry)) {
            discarded.push_back(entry);
        }
    }
    return deleteItems(discarded);
}

core::Result<int> MutationQueue::remapLocalId(EntityType type, int localId, int remoteId)
{
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE sync_queue SET entity_id = :remote "
                                 "WHERE entity_type = :type AND entity_id IS NULL AND local_id = :local"));
    query.bindValue(QStringLiteral(":remote"), remoteId);
    query.bindValue(QStringLiteral(":type"), entityTypeToString(type));
    query.bindValue(QStringLiteral(":local"), localId);
    if (!query.exec()) {
        return core::Result<int>::fail(LocalDatabase::queryError(query, QStringLiteral("remap local id")));
    }
    const int remapped = query.numRowsAffected();
    qCDebug(lcQueue) << "Remapped" << remapped << "items from" << localId << "to" << remoteId;
    return core::Result<int>::ok(remapped);
}

std::vector<QueueItem> MutationQueue::largestPending(int limit) const
{
    auto items = selectItems(QStringLiteral("status != 'synced' AND payload IS NOT NULL "
                                            "AND operation IN ('create', 'update') ORDER BY size_bytes DESC, id ASC "
                                            "LIMIT :limit"),
                             {{QStringLiteral(":limit"), limit}});
    return items;
}

core::Result<int> MutationQueue::compact(quint64 ceilingBytes)
{
    WriteGuard guard(*m_database);
    quint64 pending = pendingSizeBytes();
    if (pending <= ceilingBytes) {
        return core::Result<int>::ok(0);
    }

    int compacted = 0;
    for (QueueItem candidate : largestPending(std::numeric_limits<int>::max())) {
        if (pending <= ceilingBytes) {
            break;
        }
        if (isLeased(candidate)) {
            continue;
        }
        const qint64 before = candidate.sizeBytes;
        candidate.payload.reset();
        candidate.sizeBytes = estimateQueueItemSize(candidate.payload);
        const auto updated = updatePayload(candidate);
        if (!updated) {
            return core::Result<int>::fail(updated.error());
        }
        pending -= static_cast<quint64>(qMax<qint64>(0, before - candidate.sizeBytes));
        ++compacted;
    }

    if (pending > ceilingBytes) {
        qCWarning(lcQueue) << "Queue still over its ceiling after compaction:" << pending << ">" << ceilingBytes;
    } else {
        qCInfo(lcQueue) << "Compacted" << compacted << "payloads, pending bytes now" << pending;
    }
    return core::Result<int>::ok(compacted);
}

core::Result<int> MutationQueue::collectGarbage()
{
    const qint64 cutoff = m_clock->nowMillis() - qint64(policy().syncedRetentionHours) * 3600 * 1000;
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("DELETE FROM sync_queue WHERE status = 'synced' AND synced_at <= :cutoff"));
    query.bindValue(QStringLiteral(":cutoff"), cutoff);
    if (!query.exec()) {
        return core::Result<int>::fail(LocalDatabase::queryError(query, QStringLiteral("collect garbage")));
    }
    return core::Result<int>::ok(query.numRowsAffected());
}

void MutationQueue::releaseLeases()
{
    WriteGuard guard(*m_database);
    QMutexLocker locker(&m_leaseMutex);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE sync_queue SET leased_at = NULL WHERE id = :id"));
    for (const qint64 id : qAsConst(m_leases)) {
        query.bindValue(QStringLiteral(":id"), id);
        if (!query.exec()) {
            LocalDatabase::queryError(query, QStringLiteral("release lease"));
        }
    }
    m_leases.clear();
}

std::vector<QueueItem> MutationQueue::parkedItems() const
{
    return selectItems(QStringLiteral("status = 'failed' AND last_error = 'rejected' AND retry_count >= :max"),
                       {{QStringLiteral(":max"), policy().maxRejectedRetries}});
}

core::Result<int> MutationQueue::resetParked()
{
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE sync_queue SET status = 'pending', retry_count = 0, last_retry = NULL, "
                                 "last_error = NULL "
                                 "WHERE status = 'failed' AND last_error = 'rejected' AND retry_count >= :max"));
    query.bindValue(QStringLiteral(":max"), policy().maxRejectedRetries);
    if (!query.exec()) {
        return core::Result<int>::fail(LocalDatabase::queryError(query, QStringLiteral("reset parked")));
    }
    const int reset = query.numRowsAffected();
    if (reset > 0) {
        qCInfo(lcQueue) << "Released" << reset << "parked items for another attempt";
    }
    return core::Result<int>::ok(reset);
}

QueueCounts MutationQueue::countByStatus() const
{
    QueueCounts counts;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("SELECT status, COUNT(*), "
                                 "SUM(CASE WHEN last_error = 'rejected' AND retry_count >= :max THEN 1 ELSE 0 END) "
                                 "FROM sync_queue GROUP BY status"));
    query.bindValue(QStringLiteral(":max"), policy().maxRejectedRetries);
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("count by status"));
        return counts;
    }
    while (query.next()) {
        const auto status = queueStatusFromString(query.value(0).toString());
        const int count = query.value(1).toInt();
        if (!status) {
            continue;
        }
        switch (*status) {
        case QueueStatus::Pending:
            counts.pending = count;
            break;
        case QueueStatus::Failed:
            counts.failed = count;
            counts.parked = query.value(2).toInt();
            break;
        case QueueStatus::Synced:
            counts.synced = count;
            break;
        }
    }
    return counts;
}

bool MutationQueue::isParked(const QueueItem &item) const
{
    return item.status == QueueStatus::Failed && item.lastError == core::Error::Kind::RemoteRejected
        && item.retryCount >= policy().maxRejectedRetries;
}

bool MutationQueue::isEligible(const QueueItem &item, qint64 nowMillis) const
{
    switch (item.status) {
    case QueueStatus::Pending:
        return true;
    case QueueStatus::Synced:
        return false;
    case QueueStatus::Failed:
    default:
        break;
    }
    if (isParked(item)) {
        return false;
    }
    if (!item.lastRetry.has_value()) {
        return true;
    }
    return nowMillis - *item.lastRetry >= backoffMillis(item.retryCount);
}

qint64 MutationQueue::backoffMillis(int retryCount) const
{
    const QueuePolicy current = policy();
    if (retryCount <= 0) {
        return 0;
    }
    const int exponent = qMin(retryCount - 1, 30);
    const qint64 seconds = qMin<qint64>(qint64(current.backoffBaseSeconds) << exponent, current.backoffMaxSeconds);
    return seconds * 1000;
}

std::vector<QueueItem> MutationQueue::selectItems(const QString &where, const QVariantMap &bindings) const
{
    std::vector<QueueItem> result;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    QString sql = QStringLiteral("SELECT %1 FROM sync_queue WHERE %2").arg(QString::fromLatin1(ITEM_COLUMNS), where);
    if (!where.contains(QLatin1String("ORDER BY"))) {
        sql += QStringLiteral(" ORDER BY id ASC");
    }
    query.prepare(sql);
    for (auto it = bindings.constBegin(); it != bindings.constEnd(); ++it) {
        query.bindValue(it.key(), it.value());
    }
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("select queue items"));
        return result;
    }
    while (query.next()) {
        if (auto parsed = itemFromRow(query)) {
            result.push_back(std::move(*parsed));
        }
    }
    return result;
}

std::vector<QueueItem> MutationQueue::allOutstanding() const
{
    return selectItems(QStringLiteral("status != 'synced'"), {});
}

core::Result<QueueItem> MutationQueue::insertItem(QueueItem item)
{
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral(R"SQL(
        INSERT INTO sync_queue (operation, entity_type, entity_id, local_id, payload, timestamp, retry_count,
                                status, size_bytes)
        VALUES (:operation, :entity_type, :entity_id, :local_id, :payload, :timestamp, 0, 'pending', :size_bytes)
    )SQL"));
    query.bindValue(QStringLiteral(":operation"), queueOperationToString(item.operation));
    query.bindValue(QStringLiteral(":entity_type"), entityTypeToString(item.entityType));
    query.bindValue(QStringLiteral(":entity_id"), nullableInt(item.entityId));
    query.bindValue(QStringLiteral(":local_id"), nullableInt(item.localId));
    query.bindValue(QStringLiteral(":payload"), payloadVariant(item.payload));
    query.bindValue(QStringLiteral(":timestamp"), item.timestamp);
    query.bindValue(QStringLiteral(":size_bytes"), item.sizeBytes);
    if (!query.exec()) {
        return core::Result<QueueItem>::fail(LocalDatabase::queryError(query, QStringLiteral("enqueue")));
    }
    item.id = query.lastInsertId().toLongLong();
    qCDebug(lcQueue) << "Enqueued" << item.id << queueOperationToString(item.operation)
                     << entityTypeToString(item.entityType) << item.effectiveId() << item.sizeBytes << "bytes";
    return core::Result<QueueItem>::ok(item);
}

core::Result<bool> MutationQueue::updatePayload(const QueueItem &item)
{
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE sync_queue SET payload = :payload, size_bytes = :size WHERE id = :id"));
    query.bindValue(QStringLiteral(":payload"), payloadVariant(item.payload));
    query.bindValue(QStringLiteral(":size"), item.sizeBytes);
    query.bindValue(QStringLiteral(":id"), item.id);
    if (!query.exec()) {
        return core::Result<bool>::fail(LocalDatabase::queryError(query, QStringLiteral("update payload")));
    }
    return core::Result<bool>::ok(true);
}

core::Result<bool> MutationQueue::updateOperation(qint64 id, QueueOperation operation)
{
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE sync_queue SET operation = :operation WHERE id = :id"));
    query.bindValue(QStringLiteral(":operation"), queueOperationToString(operation));
    query.bindValue(QStringLiteral(":id"), id);
    if (!query.exec()) {
        return core::Result<bool>::fail(LocalDatabase::queryError(query, QStringLiteral("update operation")));
    }
    return core::Result<bool>::ok(true);
}

core::Result<int> MutationQueue::deleteItems(const std::vector<QueueItem> &items)
{
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("DELETE FROM sync_queue WHERE id = :id"));
    int deleted = 0;
    for (const QueueItem &entry : items) {
        query.bindValue(QStringLiteral(":id"), entry.id);
        if (!query.exec()) {
            return core::Result<int>::fail(LocalDatabase::queryError(query, QStringLiteral("delete queue item")));
        }
        deleted += query.numRowsAffected();
    }
    return core::Result<int>::ok(deleted);
}

bool MutationQueue::isLeased(const QueueItem &item) const
{
    {
        QMutexLocker locker(&m_leaseMutex);
        if (m_leases.contains(item.id)) {
            return true;
        }
    }
    return item.leasedAt.has_value() && m_clock->nowMillis() - *item.leasedAt < kLeaseExpiryMillis;
}

} // namespace data
} // namespace planner
