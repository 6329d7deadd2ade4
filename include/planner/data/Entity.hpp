#pragma once

#include <QString>

#include <optional>
#include <variant>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

enum class EntityType
{
    Task,
    User,
    Group,
};

using Entity = std::variant<Task, User, Group>;

struct EntityKey
{
    EntityType type = EntityType::Task;
    int id = 0;

    bool operator==(const EntityKey &other) const { return type == other.type && id == other.id; }
    bool operator!=(const EntityKey &other) const { return !(*this == other); }
};

uint qHash(const EntityKey &key, uint seed = 0);

EntityType entityType(const Entity &entity);
int entityId(const Entity &entity);
void setEntityId(Entity &entity, int id);
qint64 entityUpdatedAt(const Entity &entity);
void setEntityUpdatedAt(Entity &entity, qint64 updatedAt);
void setEntityLastAccessed(Entity &entity, qint64 lastAccessed);
EntityKey entityKey(const Entity &entity);

// Users and groups have no inactive state and count as enabled.
bool entityEnabled(const Entity &entity);

QString entityTypeToString(EntityType type);
std::optional<EntityType> entityTypeFromString(const QString &value);

constexpr EntityType kAllEntityTypes[] = {EntityType::Task, EntityType::User, EntityType::Group};

} // namespace data
} // namespace planner
