#include "planner/data/QueueItem.hpp"

#include <QJsonDocument>

namespace planner {
namespace data {

namespace {
constexpr qint64 kItemOverheadBytes = 100;
} // namespace

int QueueItem::effectiveId() const
{
    if (entityId.has_value()) {
        return *entityId;
    }
    return localId.value_or(0);
}

bool isLightOperation(QueueOperation operation)
{
    return operation == QueueOperation::Complete
        || operation == QueueOperation::Uncomplete
        || operation == QueueOperation::Delete;
}

qint64 estimateQueueItemSize(const std::optional<QJsonObject> &payload)
{
    if (!payload.has_value()) {
        return kItemOverheadBytes;
    }
    const QByteArray json = QJsonDocument(*payload).toJson(QJsonDocument::Compact);
    return kItemOverheadBytes + json.size();
}

QString queueOperationToString(QueueOperation operation)
{
    switch (operation) {
    case QueueOperation::Create:
        return QStringLiteral("create");
    case QueueOperation::Complete:
        return QStringLiteral("complete");
    case QueueOperation::Uncomplete:
        return QStringLiteral("uncomplete");
    case QueueOperation::Delete:
        return QStringLiteral("delete");
    case QueueOperation::Update:
    default:
        return QStringLiteral("update");
    }
}

std::optional<QueueOperation> queueOperationFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("create")) {
        return QueueOperation::Create;
    }
    if (normalized == QLatin1String("update")) {
        return QueueOperation::Update;
    }
    if (normalized == QLatin1String("complete")) {
        return QueueOperation::Complete;
    }
    if (normalized == QLatin1String("uncomplete")) {
        return QueueOperation::Uncomplete;
    }
    if (normalized == QLatin1String("delete")) {
        return QueueOperation::Delete;
    }
    return std::nullopt;
}

QString queueStatusToString(QueueStatus status)
{
    switch (status) {
    case QueueStatus::Failed:
        return QStringLiteral("failed");
    case QueueStatus::Synced:
        return QStringLiteral("synced");
    case QueueStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

std::optional<QueueStatus> queueStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("pending")) {
        return QueueStatus::Pending;
    }
    if (normalized == QLatin1String("failed")) {
        return QueueStatus::Failed;
    }
    if (normalized == QLatin1String("synced")) {
        return QueueStatus::Synced;
    }
    return std::nullopt;
}

QString queueOutcomeToString(QueueOutcome outcome)
{
    switch (outcome) {
    case QueueOutcome::TransientFailure:
        return QStringLiteral("transient");
    case QueueOutcome::Rejected:
        return QStringLiteral("rejected");
    case QueueOutcome::Synced:
    default:
        return QStringLiteral("synced");
    }
}

std::optional<core::Error::Kind> errorKindFromName(const QString &value)
{
    for (const auto kind : {core::Error::Kind::Validation, core::Error::Kind::TransientNetwork,
                            core::Error::Kind::RemoteRejected, core::Error::Kind::Storage}) {
        if (core::errorKindName(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
