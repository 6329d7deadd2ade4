#include "planner/data/CacheStore.hpp"

#include <QSqlQuery>
#include <QVariant>

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/EntityCodec.hpp"
#include "planner/data/LocalDatabase.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto TASK_COLUMNS =
    "id, title, description, task_type, recurrence_type, recurrence_interval, interval_days, "
    "reminder_time, group_id, enabled, completed, assigned_user_ids, updated_at, last_accessed, "
    "last_shown_at, created_at";
constexpr auto USER_COLUMNS = "id, name, email, role, status, updated_at, last_accessed, created_at";
constexpr auto GROUP_COLUMNS = "id, name, description, created_by, user_ids, updated_at, last_accessed, created_at";

QString tableFor(EntityType type)
{
    switch (type) {
    case EntityType::User:
        return QStringLiteral("user_cache");
    case EntityType::Group:
        return QStringLiteral("group_cache");
    case EntityType::Task:
    default:
        return QStringLiteral("task_cache");
    }
}

QString columnsFor(EntityType type)
{
    switch (type) {
    case EntityType::User:
        return QString::fromLatin1(USER_COLUMNS);
    case EntityType::Group:
        return QString::fromLatin1(GROUP_COLUMNS);
    case EntityType::Task:
    default:
        return QString::fromLatin1(TASK_COLUMNS);
    }
}

QVariant nullableInt(const std::optional<int> &value)
{
    return value.has_value() ? QVariant(*value) : QVariant(QVariant::Int);
}

QVariant nullableLong(const std::optional<qint64> &value)
{
    return value.has_value() ? QVariant(*value) : QVariant(QVariant::LongLong);
}

QVariant nullableText(const QString &value)
{
    return value.isNull() ? QVariant(QVariant::String) : QVariant(value);
}

std::optional<int> optionalInt(const QVariant &value)
{
    if (value.isNull()) {
        return std::nullopt;
    }
    return value.toInt();
}

Task taskFromRow(const QSqlQuery &query)
{
    Task task;
    task.id = query.value(0).toInt();
    task.title = query.value(1).toString();
    task.description = query.value(2).isNull() ? QString() : query.value(2).toString();
    task.taskType = taskTypeFromString(query.value(3).toString()).value_or(TaskType::OneTime);
    if (!query.value(4).isNull()) {
        task.recurrenceType = recurrenceTypeFromString(query.value(4).toString());
    }
    task.recurrenceInterval = optionalInt(query.value(5));
    task.intervalDays = optionalInt(query.value(6));
    task.reminderTime = EntityCodec::parseReminder(query.value(7).toString());
    task.groupId = optionalInt(query.value(8));
    task.enabled = query.value(9).toInt() != 0;
    task.completed = query.value(10).toInt() != 0;
    task.assignedUserIds = EntityCodec::idsFromText(query.value(11).toString());
    task.updatedAt = query.value(12).toLongLong();
    task.lastAccessed = query.value(13).toLongLong();
    if (!query.value(14).isNull()) {
        task.lastShownAt = query.value(14).toLongLong();
    }
    task.createdAt = query.value(15).toLongLong();
    return task;
}

User userFromRow(const QSqlQuery &query)
{
    User user;
    user.id = query.value(0).toInt();
    user.name = query.value(1).toString();
    user.email = query.value(2).isNull() ? QString() : query.value(2).toString();
    user.role = query.value(3).toString();
    user.status = query.value(4).toString();
    user.updatedAt = query.value(5).toLongLong();
    user.lastAccessed = query.value(6).toLongLong();
    user.createdAt = query.value(7).toLongLong();
    return user;
}

Group groupFromRow(const QSqlQuery &query)
{
    Group group;
    group.id = query.value(0).toInt();
    group.name = query.value(1).toString();
    group.description = query.value(2).isNull() ? QString() : query.value(2).toString();
    group.createdBy = query.value(3).toInt();
    group.memberIds = EntityCodec::idsFromText(query.value(4).toString());
    group.updatedAt = query.value(5).toLongLong();
    group.lastAccessed = query.value(6).toLongLong();
    group.createdAt = query.value(7).toLongLong();
    return group;
}

Entity entityFromRow(EntityType type, const QSqlQuery &query)
{
    switch (type) {
    case EntityType::User:
        return userFromRow(query);
    case EntityType::Group:
        return groupFromRow(query);
    case EntityType::Task:
    default:
        return taskFromRow(query);
    }
}
} // namespace

CacheStore::CacheStore(std::shared_ptr<LocalDatabase> database, std::shared_ptr<core::Clock> clock)
    : m_database(std::move(database))
    , m_clock(std::move(clock))
{
}

core::Result<int> CacheStore::upsert(const std::vector<Entity> &entities)
{
    if (entities.empty()) {
        return core::Result<int>::ok(0);
    }

    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<int>::fail(core::Error::storage(QStringLiteral("cannot start cache transaction")));
    }

    const qint64 now = m_clock->nowMillis();
    int applied = 0;
    for (const Entity &entity : entities) {
        const auto result = upsertOne(entity, now);
        if (!result) {
            return result;
        }
        applied += result.value();
    }

    if (!transaction.commit()) {
        return core::Result<int>::fail(core::Error::storage(QStringLiteral("cache upsert commit failed")));
    }
    qCDebug(lcCache) << "Upserted" << applied << "of" << entities.size() << "entities";
    return core::Result<int>::ok(applied);
}

core::Result<int> CacheStore::upsert(const Entity &entity)
{
    return upsert(std::vector<Entity>{entity});
}

core::Result<int> CacheStore::upsertOne(const Entity &entity, qint64 now)
{
    QSqlQuery query(m_database->connection());
    const qint64 lastAccessed = std::visit([now](const auto &value) {
        return value.lastAccessed > 0 ? value.lastAccessed : now;
    }, entity);
    const qint64 createdAt = std::visit([](const auto &value) { return value.createdAt; }, entity);
    // Remote merges carry no access time and leave the stored one alone.
    const qint64 touched = std::visit([](const auto &value) { return value.lastAccessed; }, entity);

    if (const auto *task = std::get_if<Task>(&entity)) {
        query.prepare(QStringLiteral(R"SQL(
            INSERT INTO task_cache (%1)
            VALUES (:id, :title, :description, :task_type, :recurrence_type, :recurrence_interval,
                    :interval_days, :reminder_time, :group_id, :enabled, :completed,
                    :assigned_user_ids, :updated_at, :last_accessed, :last_shown_at, :created_at)
            ON CONFLICT(id) DO UPDATE SET
                title = excluded.title,
                description = excluded.description,
                task_type = excluded.task_type,
                recurrence_type = excluded.recurrence_type,
                recurrence_interval = excluded.recurrence_interval,
                interval_days = excluded.interval_days,
                reminder_time = excluded.reminder_time,
                group_id = excluded.group_id,
                enabled = excluded.enabled,
                completed = excluded.completed,
                assigned_user_ids = excluded.assigned_user_ids,
                updated_at = excluded.updated_at,
                last_accessed = MAX(task_cache.last_accessed, :touched),
                last_shown_at = excluded.last_shown_at,
                created_at = excluded.created_at
            WHERE excluded.updated_at >= task_cache.updated_at
        )SQL").arg(QString::fromLatin1(TASK_COLUMNS)));
        query.bindValue(QStringLiteral(":id"), task->id);
        query.bindValue(QStringLiteral(":title"), task->title);
        query.bindValue(QStringLiteral(":description"), nullableText(task->description));
        query.bindValue(QStringLiteral(":task_type"), taskTypeToString(task->taskType));
        query.bindValue(QStringLiteral(":recurrence_type"),
                        task->recurrenceType ? QVariant(recurrenceTypeToString(*task->recurrenceType))
                                             : QVariant(QVariant::String));
        query.bindValue(QStringLiteral(":recurrence_interval"), nullableInt(task->recurrenceInterval));
        query.bindValue(QStringLiteral(":interval_days"), nullableInt(task->intervalDays));
        query.bindValue(QStringLiteral(":reminder_time"), EntityCodec::formatReminder(task->reminderTime));
        query.bindValue(QStringLiteral(":group_id"), nullableInt(task->groupId));
        query.bindValue(QStringLiteral(":enabled"), task->enabled ? 1 : 0);
        query.bindValue(QStringLiteral(":completed"), task->completed ? 1 : 0);
        query.bindValue(QStringLiteral(":assigned_user_ids"), EntityCodec::idsToText(task->assignedUserIds));
        query.bindValue(QStringLiteral(":updated_at"), task->updatedAt);
        query.bindValue(QStringLiteral(":last_accessed"), lastAccessed);
        query.bindValue(QStringLiteral(":touched"), touched);
        query.bindValue(QStringLiteral(":last_shown_at"), nullableLong(task->lastShownAt));
        query.bindValue(QStringLiteral(":created_at"), createdAt);
    } else if (const auto *user = std::get_if<User>(&entity)) {
        query.prepare(QStringLiteral(R"SQL(
            INSERT INTO user_cache (%1)
            VALUES (:id, :name, :email, :role, :status, :updated_at, :last_accessed, :created_at)
            ON CONFLICT(id) DO UPDATE SET
                name = excluded.name,
                email = excluded.email,
                role = excluded.role,
                status = excluded.status,
                updated_at = excluded.updated_at,
                last_accessed = MAX(user_cache.last_accessed, :touched),
                created_at = excluded.created_at
            WHERE excluded.updated_at >= user_cache.updated_at
        )SQL").arg(QString::fromLatin1(USER_COLUMNS)));
        query.bindValue(QStringLiteral(":id"), user->id);
        query.bindValue(QStringLiteral(":name"), user->name);
        query.bindValue(QStringLiteral(":email"), nullableText(user->email));
        query.bindValue(QStringLiteral(":role"), user->role);
        query.bindValue(QStringLiteral(":status"), user->status);
        query.bindValue(QStringLiteral(":updated_at"), user->updatedAt);
        query.bindValue(QStringLiteral(":last_accessed"), lastAccessed);
        query.bindValue(QStringLiteral(":touched"), touched);
        query.bindValue(QStringLiteral(":created_at"), createdAt);
    } else if (const auto *group = std::get_if<Group>(&entity)) {
        query.prepare(QStringLiteral(R"SQL(
            INSERT INTO group_cache (%1)
            VALUES (:id, :name, :description, :created_by, :user_ids, :updated_at, :last_accessed, :created_at)
            ON CONFLICT(id) DO UPDATE SET
                name = excluded.name,
                description = excluded.description,
                created_by = excluded.created_by,
                user_ids = excluded.user_ids,
                updated_at = excluded.updated_at,
                last_accessed = MAX(group_cache.last_accessed, :touched),
                created_at = excluded.created_at
            WHERE excluded.updated_at >= group_cache.updated_at
        )SQL").arg(QString::fromLatin1(GROUP_COLUMNS)));
        query.bindValue(QStringLiteral(":id"), group->id);
        query.bindValue(QStringLiteral(":name"), group->name);
        query.bindValue(QStringLiteral(":description"), nullableText(group->description));
        query.bindValue(QStringLiteral(":created_by"), group->createdBy);
        query.bindValue(QStringLiteral(":user_ids"), EntityCodec::idsToText(group->memberIds));
        query.bindValue(QStringLiteral(":updated_at"), group->updatedAt);
        query.bindValue(QStringLiteral(":last_accessed"), lastAccessed);
        query.bindValue(QStringLiteral(":touched"), touched);
        query.bindValue(QStringLiteral(":created_at"), createdAt);
    }

    if (!query.exec()) {
        return core::Result<int>::fail(LocalDatabase::queryError(
            query, QStringLiteral("upsert %1 %2").arg(entityTypeToString(entityType(entity))).arg(entityId(entity))));
    }
    return core::Result<int>::ok(query.numRowsAffected() > 0 ? 1 : 0);
}

std::optional<Entity> CacheStore::get(EntityType type, int id) const
{
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("SELECT %1 FROM %2 WHERE id = :id").arg(columnsFor(type), tableFor(type)));
    query.bindValue(QStringLiteral(":id"), id);
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("get"));
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }
    return entityFromRow(type, query);
}

std::optional<Task> CacheStore::task(int id) const
{
    const auto entity = get(EntityType::Task, id);
    if (!entity) {
        return std::nullopt;
    }
    return std::get<Task>(*entity);
}

core::Result<bool> CacheStore::remove(EntityType type, int id)
{
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("DELETE FROM %1 WHERE id = :id").arg(tableFor(type)));
    query.bindValue(QStringLiteral(":id"), id);
    if (!query.exec()) {
        return core::Result<bool>::fail(LocalDatabase::queryError(query, QStringLiteral("remove")));
    }
    const bool removed = query.numRowsAffected() > 0;
    if (removed) {
        qCDebug(lcCache) << "Removed" << entityTypeToString(type) << id;
    }
    return core::Result<bool>::ok(removed);
}

std::vector<Entity> CacheStore::listByType(EntityType type) const
{
    std::vector<Entity> result;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    if (!query.exec(QStringLiteral("SELECT %1 FROM %2 ORDER BY id").arg(columnsFor(type), tableFor(type)))) {
        LocalDatabase::queryError(query, QStringLiteral("list %1").arg(entityTypeToString(type)));
        return result;
    }
    while (query.next()) {
        result.push_back(entityFromRow(type, query));
    }
    return result;
}

std::vector<Task> CacheStore::tasks() const
{
    std::vector<Task> result;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    if (!query.exec(QStringLiteral("SELECT %1 FROM task_cache ORDER BY reminder_time, id")
                        .arg(QString::fromLatin1(TASK_COLUMNS)))) {
        LocalDatabase::queryError(query, QStringLiteral("list tasks"));
        return result;
    }
    while (query.next()) {
        result.push_back(taskFromRow(query));
    }
    return result;
}

std::vector<Task> CacheStore::listByDateRange(const QDateTime &from, const QDateTime &to) const
{
    std::vector<Task> result;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("SELECT %1 FROM task_cache WHERE reminder_time >= :from AND reminder_time <= :to "
                                 "ORDER BY reminder_time, id")
                      .arg(QString::fromLatin1(TASK_COLUMNS)));
    query.bindValue(QStringLiteral(":from"), EntityCodec::formatReminder(core::toLogical(from)));
    query.bindValue(QStringLiteral(":to"), EntityCodec::formatReminder(core::toLogical(to)));
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("list by date range"));
        return result;
    }
    while (query.next()) {
        result.push_back(taskFromRow(query));
    }
    return result;
}

core::Result<int> CacheStore::touchLastAccessed(EntityType type, const std::vector<int> &ids)
{
    if (ids.empty()) {
        return core::Result<int>::ok(0);
    }

    TransactionGuard transaction(*m_database);
    if (!transaction.isActive()) {
        return core::Result<int>::fail(core::Error::storage(QStringLiteral("cannot start touch transaction")));
    }

    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("UPDATE %1 SET last_accessed = :now WHERE id = :id").arg(tableFor(type)));
    const qint64 now = m_clock->nowMillis();
    int touched = 0;
    for (const int id : ids) {
        query.bindValue(QStringLiteral(":now"), now);
        query.bindValue(QStringLiteral(":id"), id);
        if (!query.exec()) {
            return core::Result<int>::fail(LocalDatabase::queryError(query, QStringLiteral("touch")));
        }
        touched += query.numRowsAffected() > 0 ? 1 : 0;
    }

    if (!transaction.commit()) {
        return core::Result<int>::fail(core::Error::storage(QStringLiteral("touch commit failed")));
    }
    return core::Result<int>::ok(touched);
}

quint64 CacheStore::sizeEstimateBytes() const
{
    static const char *const SIZE_QUERIES[] = {
        "SELECT COALESCE(SUM((LENGTH(title) + COALESCE(LENGTH(description), 0) + LENGTH(task_type)"
        " + COALESCE(LENGTH(recurrence_type), 0) + LENGTH(reminder_time) + LENGTH(assigned_user_ids)) * 2 + 64), 0)"
        " FROM task_cache",
        "SELECT COALESCE(SUM((LENGTH(name) + COALESCE(LENGTH(email), 0) + LENGTH(role) + LENGTH(status)) * 2 + 64), 0)"
        " FROM user_cache",
        "SELECT COALESCE(SUM((LENGTH(name) + COALESCE(LENGTH(description), 0) + LENGTH(user_ids)) * 2 + 64), 0)"
        " FROM group_cache",
    };

    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    quint64 total = 0;
    for (const char *sql : SIZE_QUERIES) {
        if (!query.exec(QString::fromLatin1(sql))) {
            LocalDatabase::queryError(query, QStringLiteral("size estimate"));
            continue;
        }
        if (query.next()) {
            total += query.value(0).toULongLong();
        }
    }
    return total;
}

quint64 CacheStore::count() const
{
    quint64 total = 0;
    for (const EntityType type : kAllEntityTypes) {
        total += count(type);
    }
    return total;
}

quint64 CacheStore::count(EntityType type) const
{
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM %1").arg(tableFor(type))) || !query.next()) {
        LocalDatabase::queryError(query, QStringLiteral("count"));
        return 0;
    }
    return query.value(0).toULongLong();
}

std::vector<EntityKey> CacheStore::evictionCandidates(int limit) const
{
    std::vector<EntityKey> result;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("SELECT id FROM task_cache WHERE enabled = 0 ORDER BY last_accessed ASC, id ASC "
                                 "LIMIT :limit"));
    query.bindValue(QStringLiteral(":limit"), limit);
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("eviction candidates"));
        return result;
    }
    while (query.next()) {
        result.push_back(EntityKey{EntityType::Task, query.value(0).toInt()});
    }
    return result;
}

std::vector<EntityKey> CacheStore::expiredInactive(qint64 cutoffMillis) const
{
    std::vector<EntityKey> result;
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("SELECT id FROM task_cache WHERE enabled = 0 AND updated_at < :cutoff "
                                 "ORDER BY updated_at ASC, id ASC"));
    query.bindValue(QStringLiteral(":cutoff"), cutoffMillis);
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("expired inactive"));
        return result;
    }
    while (query.next()) {
        result.push_back(EntityKey{EntityType::Task, query.value(0).toInt()});
    }
    return result;
}

int CacheStore::lowestId(EntityType type) const
{
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    if (!query.exec(QStringLiteral("SELECT COALESCE(MIN(id), 0) FROM %1").arg(tableFor(type))) || !query.next()) {
        LocalDatabase::queryError(query, QStringLiteral("lowest id"));
        return 0;
    }
    return query.value(0).toInt();
}

LocalDatabase &CacheStore::database() const
{
    return *m_database;
}

} // namespace data
} // namespace planner
