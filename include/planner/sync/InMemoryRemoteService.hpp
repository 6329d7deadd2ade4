#pragma once

#include <QHash>
#include <QMutex>

#include <memory>
#include <optional>
#include <vector>

#include "planner/sync/RemoteService.hpp"

namespace planner {
namespace core {
class Clock;
}

namespace sync {

// In-process remote used by tests and the loopback CLI mode. Assigns ids to
// creates, stamps updatedAt with its own clock and can simulate outages and
// rejections.
class InMemoryRemoteService : public RemoteService
{
public:
    explicit InMemoryRemoteService(std::shared_ptr<core::Clock> clock);
    ~InMemoryRemoteService() override;

    core::Result<std::vector<data::Entity>> listEntities(data::EntityType type) override;
    core::Result<RemoteAck> applyOperation(const RemoteOperation &operation) override;

    void setOffline(bool offline);
    bool isOffline() const;
    // Answers the next operations with 503.
    void failNextTransient(int count);
    void rejectNext(int count, int statusCode = 409);
    void rejectEntity(data::EntityType type, int id, int statusCode = 422);
    void clearRejections();

    // Writes made by another client, bypassing the operation log.
    data::Entity seed(data::Entity entity);
    bool removeEntity(data::EntityType type, int id);
    std::optional<data::Entity> entity(data::EntityType type, int id) const;

    std::vector<RemoteOperation> appliedOperations() const;
    int listCalls() const;

private:
    core::Result<RemoteAck> apply(const RemoteOperation &operation);
    qint64 nextTimestamp(qint64 previous) const;

    std::shared_ptr<core::Clock> m_clock;
    mutable QMutex m_mutex;
    QHash<data::EntityKey, data::Entity> m_entities;
    QHash<data::EntityKey, int> m_rejectedEntities;
    std::vector<RemoteOperation> m_applied;
    int m_nextId = 1000;
    bool m_offline = false;
    int m_transientFailures = 0;
    int m_rejections = 0;
    int m_rejectionStatus = 409;
    int m_listCalls = 0;
};

} // namespace sync
} // namespace planner
