#include "planner/sync/InMemoryRemoteService.hpp"

#include <QMutexLocker>

#include <algorithm>
#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/EntityCodec.hpp"

namespace planner {
namespace sync {

InMemoryRemoteService::InMemoryRemoteService(std::shared_ptr<core::Clock> clock)
    : m_clock(std::move(clock))
{
}

InMemoryRemoteService::~InMemoryRemoteService() = default;

core::Result<std::vector<data::Entity>> InMemoryRemoteService::listEntities(data::EntityType type)
{
    QMutexLocker locker(&m_mutex);
    ++m_listCalls;
    if (m_offline) {
        return core::Result<std::vector<data::Entity>>::fail(
            core::Error::transientNetwork(QStringLiteral("remote unreachable")));
    }

    std::vector<data::Entity> result;
    for (auto it = m_entities.constBegin(); it != m_entities.constEnd(); ++it) {
        if (it.key().type == type) {
            result.push_back(it.value());
        }
    }
    std::sort(result.begin(), result.end(), [](const data::Entity &lhs, const data::Entity &rhs) {
        return data::entityId(lhs) < data::entityId(rhs);
    });
    return core::Result<std::vector<data::Entity>>::ok(std::move(result));
}

core::Result<RemoteAck> InMemoryRemoteService::applyOperation(const RemoteOperation &operation)
{
    QMutexLocker locker(&m_mutex);
    if (m_offline) {
        return core::Result<RemoteAck>::fail(core::Error::transientNetwork(QStringLiteral("remote unreachable")));
    }
    if (m_transientFailures > 0) {
        --m_transientFailures;
        core::Error unavailable = core::Error::transientNetwork(QStringLiteral("service unavailable"));
        unavailable.statusCode = 503;
        return core::Result<RemoteAck>::fail(unavailable);
    }
    if (m_rejections > 0) {
        --m_rejections;
        return core::Result<RemoteAck>::fail(
            core::Error::remoteRejected(m_rejectionStatus, QStringLiteral("rejected by remote")));
    }
    if (operation.entityId) {
        const data::EntityKey key{operation.entityType, *operation.entityId};
        if (m_rejectedEntities.contains(key)) {
            return core::Result<RemoteAck>::fail(core::Error::remoteRejected(
                m_rejectedEntities.value(key), QStringLiteral("entity %1 rejected").arg(key.id)));
        }
    }

    auto result = apply(operation);
    if (result) {
        m_applied.push_back(operation);
    }
    return result;
}

core::Result<RemoteAck> InMemoryRemoteService::apply(const RemoteOperation &operation)
{
    const qint64 now = m_clock->nowMillis();

    if (operation.operation == data::QueueOperation::Create) {
        QJsonObject object = operation.payload;
        const int id = m_nextId++;
        object.insert(QStringLiteral("id"), id);
        object.insert(QStringLiteral("updated_at"), nextTimestamp(0));
        auto parsed = data::EntityCodec::fromJson(operation.entityType, object);
        if (!parsed) {
            return core::Result<RemoteAck>::fail(core::Error::remoteRejected(422, parsed.error().message));
        }
        if (auto *task = std::get_if<data::Task>(&parsed.value())) {
            task->createdAt = now;
        }
        m_entities.insert(data::entityKey(parsed.value()), parsed.value());
        return core::Result<RemoteAck>::ok(RemoteAck{parsed.value()});
    }

    if (!operation.entityId) {
        return core::Result<RemoteAck>::fail(
            core::Error::remoteRejected(400, QStringLiteral("operation without entity id")));
    }
    const data::EntityKey key{operation.entityType, *operation.entityId};
    auto it = m_entities.find(key);

    if (operation.operation == data::QueueOperation::Delete) {
        if (it != m_entities.end()) {
            m_entities.erase(it);
        }
        return core::Result<RemoteAck>::ok(RemoteAck{});
    }
    if (it == m_entities.end()) {
        return core::Result<RemoteAck>::fail(
            core::Error::remoteRejected(404, QStringLiteral("entity %1 not found").arg(key.id)));
    }

    QJsonObject object = data::EntityCodec::toJson(it.value());
    if (operation.operation == data::QueueOperation::Update) {
        for (auto field = operation.payload.constBegin(); field != operation.payload.constEnd(); ++field) {
            if (field.key() != QLatin1String("id")) {
                object.insert(field.key(), field.value());
            }
        }
    } else {
        object.insert(QStringLiteral("completed"), operation.operation == data::QueueOperation::Complete);
    }
    object.insert(QStringLiteral("updated_at"), nextTimestamp(data::entityUpdatedAt(it.value())));

    auto parsed = data::EntityCodec::fromJson(operation.entityType, object);
    if (!parsed) {
        return core::Result<RemoteAck>::fail(core::Error::remoteRejected(422, parsed.error().message));
    }
    it.value() = parsed.value();
    return core::Result<RemoteAck>::ok(RemoteAck{parsed.value()});
}

void InMemoryRemoteService::setOffline(bool offline)
{
    QMutexLocker locker(&m_mutex);
    m_offline = offline;
}

bool InMemoryRemoteService::isOffline() const
{
    QMutexLocker locker(&m_mutex);
    return m_offline;
}

void InMemoryRemoteService::failNextTransient(int count)
{
    QMutexLocker locker(&m_mutex);
    m_transientFailures = count;
}

void InMemoryRemoteService::rejectNext(int count, int statusCode)
{
    QMutexLocker locker(&m_mutex);
    m_rejections = count;
    m_rejectionStatus = statusCode;
}

void InMemoryRemoteService::rejectEntity(data::EntityType type, int id, int statusCode)
{
    QMutexLocker locker(&m_mutex);
    m_rejectedEntities.insert(data::EntityKey{type, id}, statusCode);
}

void InMemoryRemoteService::clearRejections()
{
    QMutexLocker locker(&m_mutex);
    m_rejectedEntities.clear();
    m_rejections = 0;
}

data::Entity InMemoryRemoteService::seed(data::Entity entity)
{
    QMutexLocker locker(&m_mutex);
    if (data::entityId(entity) <= 0) {
        data::setEntityId(entity, m_nextId++);
    } else {
        m_nextId = qMax(m_nextId, data::entityId(entity) + 1);
    }
    if (data::entityUpdatedAt(entity) <= 0) {
        data::setEntityUpdatedAt(entity, nextTimestamp(0));
    }
    data::setEntityLastAccessed(entity, 0);
    m_entities.insert(data::entityKey(entity), entity);
    return entity;
}

bool InMemoryRemoteService::removeEntity(data::EntityType type, int id)
{
    QMutexLocker locker(&m_mutex);
    return m_entities.remove(data::EntityKey{type, id}) > 0;
}

std::optional<data::Entity> InMemoryRemoteService::entity(data::EntityType type, int id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_entities.constFind(data::EntityKey{type, id});
    if (it == m_entities.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::vector<RemoteOperation> InMemoryRemoteService::appliedOperations() const
{
    QMutexLocker locker(&m_mutex);
    return m_applied;
}

int InMemoryRemoteService::listCalls() const
{
    QMutexLocker locker(&m_mutex);
    return m_listCalls;
}

qint64 InMemoryRemoteService::nextTimestamp(qint64 previous) const
{
    return qMax(m_clock->nowMillis(), previous + 1);
}

} // namespace sync
} // namespace planner
