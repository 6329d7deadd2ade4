#pragma once

#include <QDateTime>

#include <memory>
#include <optional>
#include <vector>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"
#include "planner/data/QueueItem.hpp"

namespace planner {
namespace core {
class Clock;
class DayBoundaryEngine;
class SettingsSource;
}

namespace data {

class CacheStore;
class LocalDatabase;
class MutationQueue;

struct EntityFilter
{
    EntityType type = EntityType::Task;
    // Inclusive reminder range, tasks only.
    std::optional<QDateTime> from;
    std::optional<QDateTime> to;
    bool enabledOnly = false;
    // Today's view for the current logical day.
    bool todayOnly = false;
    // Keeps unassigned tasks and tasks assigned to this user.
    std::optional<int> userId;
};

// Foreground entry point. Every edit validates, writes the cache and appends
// to the mutation queue in one local transaction; nothing here waits on the network.
// Reads and edits first roll the cache over if a logical day began since the last run.
class OfflineRepository
{
public:
    OfflineRepository(std::shared_ptr<LocalDatabase> database, std::shared_ptr<CacheStore> cache,
                      std::shared_ptr<MutationQueue> queue, std::shared_ptr<core::DayBoundaryEngine> dayBoundary,
                      std::shared_ptr<core::Clock> clock, const core::SettingsSource &settings);

    std::vector<Entity> getCachedEntities(const EntityFilter &filter = {});
    std::vector<Task> todayTasks(std::optional<int> userId = std::nullopt);
    std::optional<Task> findTask(int id) const;

    core::Result<Entity> enqueueUserEdit(QueueOperation operation, Entity entity);

    core::Result<Task> createTask(Task task);
    core::Result<Task> updateTask(Task task);
    core::Result<Task> completeTask(int id);
    core::Result<Task> uncompleteTask(int id);
    core::Result<Task> deleteTask(int id);

private:
    void catchUpDay();
    core::Result<Entity> create(Entity entity);
    core::Result<Entity> update(Entity entity);
    core::Result<Entity> toggle(QueueOperation operation, const Entity &entity);
    core::Result<Entity> remove(const Entity &entity);
    core::Result<QueueItem> enqueueFor(QueueOperation operation, const Entity &entity,
                                       std::optional<QJsonObject> payload);
    static core::Result<Task> asTask(const core::Result<Entity> &result);

    std::shared_ptr<LocalDatabase> m_database;
    std::shared_ptr<CacheStore> m_cache;
    std::shared_ptr<MutationQueue> m_queue;
    std::shared_ptr<core::DayBoundaryEngine> m_dayBoundary;
    std::shared_ptr<core::Clock> m_clock;
    const core::SettingsSource &m_settings;
};

} // namespace data
} // namespace planner
