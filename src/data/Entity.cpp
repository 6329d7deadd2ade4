#include "planner/data/Entity.hpp"

#include <QHash>

namespace planner {
namespace data {

namespace {
template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

uint qHash(const EntityKey &key, uint seed)
{
    return ::qHash(qMakePair(static_cast<int>(key.type), key.id), seed);
}

EntityType entityType(const Entity &entity)
{
    return std::visit(Overloaded{
                          [](const Task &) { return EntityType::Task; },
                          [](const User &) { return EntityType::User; },
                          [](const Group &) { return EntityType::Group; },
                      },
                      entity);
}

int entityId(const Entity &entity)
{
    return std::visit([](const auto &value) { return value.id; }, entity);
}

void setEntityId(Entity &entity, int id)
{
    std::visit([id](auto &value) { value.id = id; }, entity);
}

qint64 entityUpdatedAt(const Entity &entity)
{
    return std::visit([](const auto &value) { return value.updatedAt; }, entity);
}

void setEntityUpdatedAt(Entity &entity, qint64 updatedAt)
{
    std::visit([updatedAt](auto &value) { value.updatedAt = updatedAt; }, entity);
}

void setEntityLastAccessed(Entity &entity, qint64 lastAccessed)
{
    std::visit([lastAccessed](auto &value) { value.lastAccessed = lastAccessed; }, entity);
}

EntityKey entityKey(const Entity &entity)
{
    return EntityKey{entityType(entity), entityId(entity)};
}

bool entityEnabled(const Entity &entity)
{
    if (const auto *task = std::get_if<Task>(&entity)) {
        return task->enabled;
    }
    return true;
}

QString entityTypeToString(EntityType type)
{
    switch (type) {
    case EntityType::User:
        return QStringLiteral("user");
    case EntityType::Group:
        return QStringLiteral("group");
    case EntityType::Task:
    default:
        return QStringLiteral("task");
    }
}

std::optional<EntityType> entityTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("task")) {
        return EntityType::Task;
    }
    if (normalized == QLatin1String("user")) {
        return EntityType::User;
    }
    if (normalized == QLatin1String("group")) {
        return EntityType::Group;
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
