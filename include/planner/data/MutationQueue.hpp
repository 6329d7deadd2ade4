#pragma once

#include <QJsonObject>
#include <QMutex>
#include <QSet>
#include <QVariant>

#include <memory>
#include <optional>
#include <vector>

#include "planner/core/Result.hpp"
#include "planner/data/QueueItem.hpp"

namespace planner {
namespace core {
class Clock;
struct SyncSettings;
}

namespace data {

class LocalDatabase;

struct QueuePolicy
{
    int maxRejectedRetries = 5;
    int backoffBaseSeconds = 30;
    int backoffMaxSeconds = 3600;
    int syncedRetentionHours = 24;
    quint64 ceilingBytes = 5ull * 1024 * 1024;

    static QueuePolicy fromSettings(const core::SyncSettings &settings);
};

struct QueueCounts
{
    int pending = 0;
    int failed = 0;
    int synced = 0;
    int parked = 0;
};

// Durable FIFO of local mutations waiting for the remote service, stored in
// sync_queue. Items of one entity are keyed by the remote id when known and by
// the temporary local id before that.
class MutationQueue
{
public:
    MutationQueue(std::shared_ptr<LocalDatabase> database, std::shared_ptr<core::Clock> clock,
                  QueuePolicy policy = {});

    void setPolicy(const QueuePolicy &policy);
    QueuePolicy policy() const;

    core::Result<QueueItem> enqueue(QueueOperation operation, EntityType type, std::optional<int> entityId,
                                    std::optional<QJsonObject> payload, std::optional<int> localId = std::nullopt);

    // Leases the returned items until markResult() or releaseLeases(). The lease
    // is stored with the row so other processes on the same file honour it.
    std::vector<QueueItem> drainPending(int limit);
    core::Result<bool> markResult(qint64 id, QueueOutcome outcome);

    quint64 pendingSizeBytes() const;
    core::Result<int> clear();

    std::optional<QueueItem> item(qint64 id) const;
    std::vector<QueueItem> outstandingFor(EntityType type, int key) const;
    bool hasOutstanding(EntityType type, int key) const;
    bool hasLeased(EntityType type, int key) const;
    // Drops every unleased outstanding item of an entity that never reached the remote.
    core::Result<int> discardOutstanding(EntityType type, int key);
    core::Result<int> remapLocalId(EntityType type, int localId, int remoteId);

    std::vector<QueueItem> largestPending(int limit) const;
    core::Result<int> compact(quint64 ceilingBytes);
    core::Result<int> collectGarbage();
    void releaseLeases();

    std::vector<QueueItem> parkedItems() const;
    core::Result<int> resetParked();
    QueueCounts countByStatus() const;

    bool isParked(const QueueItem &item) const;
    bool isEligible(const QueueItem &item, qint64 nowMillis) const;
    qint64 backoffMillis(int retryCount) const;

private:
    std::vector<QueueItem> selectItems(const QString &where, const QVariantMap &bindings) const;
    std::vector<QueueItem> allOutstanding() const;
    core::Result<QueueItem> insertItem(QueueItem item);
    core::Result<bool> updatePayload(const QueueItem &item);
    core::Result<bool> updateOperation(qint64 id, QueueOperation operation);
    core::Result<int> deleteItems(const std::vector<QueueItem> &items);
    core::Result<bool> writeResult(qint64 id, QueueOutcome outcome);
    bool isLeased(const QueueItem &item) const;

    std::shared_ptr<LocalDatabase> m_database;
    std::shared_ptr<core::Clock> m_clock;
    QueuePolicy m_policy;
    mutable QMutex m_leaseMutex;
    QSet<qint64> m_leases;
};

} // namespace data
} // namespace planner
