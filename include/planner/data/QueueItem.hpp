#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"

namespace planner {
namespace data {

enum class QueueOperation
{
    Create,
    Update,
    Complete,
    Uncomplete,
    Delete,
};

enum class QueueStatus
{
    Pending,
    Failed,
    Synced,
};

enum class QueueOutcome
{
    Synced,
    TransientFailure,
    Rejected,
};

struct QueueItem
{
    qint64 id = 0;
    QueueOperation operation = QueueOperation::Update;
    EntityType entityType = EntityType::Task;
    std::optional<int> entityId;
    std::optional<int> localId;
    std::optional<QJsonObject> payload;
    qint64 timestamp = 0;
    int retryCount = 0;
    std::optional<qint64> lastRetry;
    QueueStatus status = QueueStatus::Pending;
    std::optional<core::Error::Kind> lastError;
    std::optional<qint64> syncedAt;
    qint64 sizeBytes = 0;
    // Set while some process has the item in flight.
    std::optional<qint64> leasedAt;

    // Id under which the entity is currently known locally.
    int effectiveId() const;
    bool isOutstanding() const { return status != QueueStatus::Synced; }
};

// complete, uncomplete and delete jump ahead of create and update in a drain batch.
bool isLightOperation(QueueOperation operation);

qint64 estimateQueueItemSize(const std::optional<QJsonObject> &payload);

QString queueOperationToString(QueueOperation operation);
std::optional<QueueOperation> queueOperationFromString(const QString &value);
QString queueStatusToString(QueueStatus status);
std::optional<QueueStatus> queueStatusFromString(const QString &value);
QString queueOutcomeToString(QueueOutcome outcome);
std::optional<core::Error::Kind> errorKindFromName(const QString &value);

} // namespace data
} // namespace planner
