#include "planner/data/OfflineRepository.hpp"

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/Settings.hpp"
#include "planner/core/TaskDateCalculator.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/EntityCodec.hpp"
#include "planner/data/LocalDatabase.hpp"
#include "planner/data/MutationQueue.hpp"
#include "planner/data/TaskValidator.hpp"

namespace planner {
namespace data {

OfflineRepository::OfflineRepository(std::shared_ptr<LocalDatabase> database, std::shared_ptr<CacheStore> cache,
                                     std::shared_ptr<MutationQueue> queue,
                                     std::shared_ptr<core::DayBoundaryEngine> dayBoundary,
                                     std::shared_ptr<core::Clock> clock, const core::SettingsSource &settings)
    : m_database(std::move(database))
    , m_cache(std::move(cache))
    , m_queue(std::move(queue))
    , m_dayBoundary(std::move(dayBoundary))
    , m_clock(std::move(clock))
    , m_settings(settings)
{
}

std::vector<Entity> OfflineRepository::getCachedEntities(const EntityFilter &filter)
{
    catchUpDay();
    std::vector<Entity> result;
    if (filter.type != EntityType::Task) {
        result = m_cache->listByType(filter.type);
    } else {
        std::vector<Task> tasks = (filter.from || filter.to)
            ? m_cache->listByDateRange(filter.from.value_or(QDateTime(QDate(1970, 1, 1), QTime(0, 0), Qt::UTC)),
                                       filter.to.value_or(QDateTime(QDate(9999, 12, 31), QTime(23, 59, 59), Qt::UTC)))
            : m_cache->tasks();
        if (filter.todayOnly) {
            tasks = core::TaskDateCalculator::filterToday(tasks, m_clock->now(), m_settings.current().dayStartHour,
                                                          filter.userId);
        }
        for (Task &task : tasks) {
            if (filter.enabledOnly && !task.enabled) {
                continue;
            }
            if (!filter.todayOnly && filter.userId && !task.assignedUserIds.isEmpty()
                && !task.assignedUserIds.contains(*filter.userId)) {
                continue;
            }
            result.push_back(std::move(task));
        }
    }

    std::vector<int> ids;
    ids.reserve(result.size());
    for (const Entity &entity : result) {
        ids.push_back(entityId(entity));
    }
    const auto touched = m_cache->touchLastAccessed(filter.type, ids);
    if (!touched) {
        qCWarning(lcCache) << "Could not record access:" << touched.error().message;
    }
    return result;
}

std::vector<Task> OfflineRepository::todayTasks(std::optional<int> userId)
{
    EntityFilter filter;
    filter.todayOnly = true;
    filter.userId = userId;
    std::vector<Task> tasks;
    for (Entity &entity : getCachedEntities(filter)) {
        tasks.push_back(std::get<Task>(std::move(entity)));
    }
    return tasks;
}

std::optional<Task> OfflineRepository::findTask(int id) const
{
    return m_cache->task(id);
}

core::Result<Entity> OfflineRepository::enqueueUserEdit(QueueOperation operation, Entity entity)
{
    catchUpDay();
    switch (operation) {
    case QueueOperation::Create:
        return create(std::move(entity));
    case QueueOperation::Update:
        return update(std::move(entity));
    case QueueOperation::Complete:
    case QueueOperation::Uncomplete:
        return toggle(operation, entity);
    case QueueOperation::Delete:
    default:
        return remove(entity);
    }
}

core::Result<Task> OfflineRepository::createTask(Task task)
{
    return asTask(enqueueUserEdit(QueueOperation::Create, std::move(task)));
}

core::Result<Task> OfflineRepository::updateTask(Task task)
{
    return asTask(enqueueUserEdit(QueueOperation::Update, std::move(task)));
}

core::Result<Task> OfflineRepository::completeTask(int id)
{
    const auto task = m_cache->task(id);
    if (!task) {
        return core::Result<Task>::fail(core::Error::validation(QStringLiteral("unknown task %1").arg(id)));
    }
    return asTask(enqueueUserEdit(QueueOperation::Complete, *task));
}

core::Result<Task> OfflineRepository::uncompleteTask(int id)
{
    const auto task = m_cache->task(id);
    if (!task) {
        return core::Result<Task>::fail(core::Error::validation(QStringLiteral("unknown task %1").arg(id)));
    }
    return asTask(enqueueUserEdit(QueueOperation::Uncomplete, *task));
}

core::Result<Task> OfflineRepository::deleteTask(int id)
{
    const auto task = m_cache->task(id);
    if (!task) {
        return core::Result<Task>::fail(core::Error::validation(QStringLiteral("unknown task %1").arg(id)));
    }
    return asTask(enqueueUserEdit(QueueOperation::Delete, *task));
}

void OfflineRepository::catchUpDay()
{
    const auto rollover = m_dayBoundary->runIfNewDay(m_clock->now(), m_settings.current().dayStartHour);
    if (!rollover) {
        qCWarning(lcDayBoundary) << "Day rollover on local access failed:" << rollover.error().message;
    }
}

core::Result<Entity> OfflineRepository::create(Entity entity)
{
    const auto valid = TaskValidator::validate(entity);
    if (!valid) {
        return core::Result<Entity>::fail(valid.error());
    }

    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("cannot start edit transaction")));
    }

    const EntityType type = entityType(entity);
    const qint64 now = m_clock->nowMillis();
    setEntityId(entity, qMin(m_cache->lowestId(type), 0) - 1);
    setEntityUpdatedAt(entity, now);
    setEntityLastAccessed(entity, now);
    std::visit([now](auto &value) { value.createdAt = now; }, entity);

    const auto written = m_cache->upsert(entity);
    if (!written) {
        return core::Result<Entity>::fail(written.error());
    }
    const auto queued = enqueueFor(QueueOperation::Create, entity, EntityCodec::toPayload(entity, false));
    if (!queued) {
        return core::Result<Entity>::fail(queued.error());
    }
    if (!transaction.commit()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("create commit failed")));
    }
    qCDebug(lcQueue) << "Created local" << entityTypeToString(type) << entityId(entity);
    return core::Result<Entity>::ok(entity);
}

core::Result<Entity> OfflineRepository::update(Entity entity)
{
    const auto valid = TaskValidator::validate(entity);
    if (!valid) {
        return core::Result<Entity>::fail(valid.error());
    }

    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("cannot start edit transaction")));
    }

    const auto existing = m_cache->get(entityType(entity), entityId(entity));
    if (!existing) {
        return core::Result<Entity>::fail(core::Error::validation(
            QStringLiteral("unknown %1 %2").arg(entityTypeToString(entityType(entity))).arg(entityId(entity))));
    }
    setEntityUpdatedAt(entity, qMax(m_clock->nowMillis(), entityUpdatedAt(*existing)));
    setEntityLastAccessed(entity, m_clock->nowMillis());
    const qint64 createdAt = std::visit([](const auto &value) { return value.createdAt; }, *existing);
    std::visit([createdAt](auto &value) { value.createdAt = createdAt; }, entity);

    const auto written = m_cache->upsert(entity);
    if (!written) {
        return core::Result<Entity>::fail(written.error());
    }
    const auto queued = enqueueFor(QueueOperation::Update, entity, EntityCodec::toPayload(entity, true));
    if (!queued) {
        return core::Result<Entity>::fail(queued.error());
    }
    if (!transaction.commit()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("update commit failed")));
    }
    return core::Result<Entity>::ok(entity);
}

core::Result<Entity> OfflineRepository::toggle(QueueOperation operation, const Entity &entity)
{
    if (entityType(entity) != EntityType::Task) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("only tasks can be completed")));
    }

    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("cannot start edit transaction")));
    }

    auto task = m_cache->task(entityId(entity));
    if (!task) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("unknown task %1").arg(entityId(entity))));
    }
    task->completed = operation == QueueOperation::Complete;
    task->updatedAt = qMax(m_clock->nowMillis(), task->updatedAt);
    task->lastAccessed = m_clock->nowMillis();

    const auto written = m_cache->upsert(Entity(*task));
    if (!written) {
        return core::Result<Entity>::fail(written.error());
    }
    const auto queued = enqueueFor(operation, *task, std::nullopt);
    if (!queued) {
        return core::Result<Entity>::fail(queued.error());
    }
    if (!transaction.commit()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("toggle commit failed")));
    }
    return core::Result<Entity>::ok(Entity(*task));
}

core::Result<Entity> OfflineRepository::remove(const Entity &entity)
{
    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("cannot start edit transaction")));
    }

    const EntityType type = entityType(entity);
    const int id = entityId(entity);
    auto existing = m_cache->get(type, id);
    if (!existing) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("unknown %1 %2").arg(entityTypeToString(type)).arg(id)));
    }

    if (id < 0 && !m_queue->hasLeased(type, id)) {
        // Never reached the remote: drop it locally instead of queueing a delete.
        const auto discarded = m_queue->discardOutstanding(type, id);
        if (!discarded) {
            return core::Result<Entity>::fail(discarded.error());
        }
        const auto removed = m_cache->remove(type, id);
        if (!removed) {
            return core::Result<Entity>::fail(removed.error());
        }
        if (!transaction.commit()) {
            return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("delete commit failed")));
        }
        qCDebug(lcQueue) << "Discarded local-only" << entityTypeToString(type) << id << "and"
                         << discarded.value() << "queued items";
        if (auto *task = std::get_if<Task>(&*existing)) {
            task->enabled = false;
        }
        return core::Result<Entity>::ok(*existing);
    }

    if (auto *task = std::get_if<Task>(&*existing)) {
        task->enabled = false;
    }
    setEntityUpdatedAt(*existing, qMax(m_clock->nowMillis(), entityUpdatedAt(*existing)));

    const auto written = m_cache->upsert(*existing);
    if (!written) {
        return core::Result<Entity>::fail(written.error());
    }
    const auto queued = enqueueFor(QueueOperation::Delete, *existing, std::nullopt);
    if (!queued) {
        return core::Result<Entity>::fail(queued.error());
    }
    if (!transaction.commit()) {
        return core::Result<Entity>::fail(core::Error::storage(QStringLiteral("delete commit failed")));
    }
    return core::Result<Entity>::ok(*existing);
}

core::Result<QueueItem> OfflineRepository::enqueueFor(QueueOperation operation, const Entity &entity,
                                                      std::optional<QJsonObject> payload)
{
    const int id = entityId(entity);
    const std::optional<int> remoteId = id > 0 ? std::optional<int>(id) : std::nullopt;
    const std::optional<int> localId = id < 0 ? std::optional<int>(id) : std::nullopt;
    return m_queue->enqueue(operation, entityType(entity), remoteId, std::move(payload), localId);
}

core::Result<Task> OfflineRepository::asTask(const core::Result<Entity> &result)
{
    if (!result) {
        return core::Result<Task>::fail(result.error());
    }
    return core::Result<Task>::ok(std::get<Task>(result.value()));
}

} // namespace data
} // namespace planner
