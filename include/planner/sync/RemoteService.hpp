#pragma once

#include <QJsonObject>

#include <optional>
#include <vector>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"
#include "planner/data/QueueItem.hpp"

namespace planner {
namespace sync {

struct RemoteOperation
{
    data::QueueOperation operation = data::QueueOperation::Update;
    data::EntityType entityType = data::EntityType::Task;
    std::optional<int> entityId;
    std::optional<int> localId;
    QJsonObject payload;
    qint64 timestamp = 0;
    qint64 queueItemId = 0;
};

struct RemoteAck
{
    // Authoritative state after the operation, when the remote returns one.
    std::optional<data::Entity> entity;
};

// Authoritative remote store. Implementations report failures as
// TransientNetwork or RemoteRejected errors and never throw.
class RemoteService
{
public:
    virtual ~RemoteService() = default;

    virtual core::Result<std::vector<data::Entity>> listEntities(data::EntityType type) = 0;
    virtual core::Result<RemoteAck> applyOperation(const RemoteOperation &operation) = 0;
};

} // namespace sync
} // namespace planner
