#pragma once

#include <QDateTime>

#include <memory>
#include <optional>
#include <vector>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"

namespace planner {
namespace core {
class Clock;
}

namespace data {

class LocalDatabase;

// Durable entity cache over task_cache, user_cache and group_cache.
// Writes are last-write-wins on updatedAt: older records are ignored and
// equal timestamps overwrite.
class CacheStore
{
public:
    CacheStore(std::shared_ptr<LocalDatabase> database, std::shared_ptr<core::Clock> clock);
    ~CacheStore() = default;

    core::Result<int> upsert(const std::vector<Entity> &entities);
    core::Result<int> upsert(const Entity &entity);

    std::optional<Entity> get(EntityType type, int id) const;
    std::optional<Task> task(int id) const;
    core::Result<bool> remove(EntityType type, int id);

    std::vector<Entity> listByType(EntityType type) const;
    std::vector<Task> tasks() const;
    // Inclusive on both ends, compared on the logical reminder time.
    std::vector<Task> listByDateRange(const QDateTime &from, const QDateTime &to) const;

    core::Result<int> touchLastAccessed(EntityType type, const std::vector<int> &ids);

    quint64 sizeEstimateBytes() const;
    quint64 count() const;
    quint64 count(EntityType type) const;

    // Inactive tasks, least recently accessed first.
    std::vector<EntityKey> evictionCandidates(int limit) const;
    // Inactive tasks last updated before the cutoff, oldest first.
    std::vector<EntityKey> expiredInactive(qint64 cutoffMillis) const;
    // Smallest id in the table, 0 when empty.
    int lowestId(EntityType type) const;

    LocalDatabase &database() const;

private:
    core::Result<int> upsertOne(const Entity &entity, qint64 now);

    std::shared_ptr<LocalDatabase> m_database;
    std::shared_ptr<core::Clock> m_clock;
};

} // namespace data
} // namespace planner
