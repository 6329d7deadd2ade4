#include "planner/data/EntityCodec.hpp"

#include <QJsonDocument>

#include <algorithm>
#include <vector>

namespace planner {
namespace data {

namespace {
constexpr auto REMINDER_FORMAT = "yyyy-MM-ddTHH:mm:ss";

QJsonValue optionalInt(const std::optional<int> &value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonValue nullableString(const QString &value)
{
    return value.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(value);
}

QString stringField(const QJsonObject &object, const char *name)
{
    const QJsonValue value = object.value(QLatin1String(name));
    return value.isString() ? value.toString() : QString();
}

bool readOptionalInt(const QJsonObject &object, const char *name, std::optional<int> &out)
{
    const QJsonValue value = object.value(QLatin1String(name));
    if (value.isUndefined() || value.isNull()) {
        out.reset();
        return true;
    }
    if (!value.isDouble()) {
        return false;
    }
    out = value.toInt();
    return true;
}

std::vector<int> sortedIds(const QSet<int> &ids)
{
    std::vector<int> sorted(ids.cbegin(), ids.cend());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}
} // namespace

QJsonObject EntityCodec::toJson(const Entity &entity)
{
    QJsonObject object = toPayload(entity, true);
    object.insert(QStringLiteral("updated_at"), entityUpdatedAt(entity));
    return object;
}

QJsonObject EntityCodec::toPayload(const Entity &entity, bool includeId)
{
    QJsonObject object;
    if (includeId) {
        object.insert(QStringLiteral("id"), entityId(entity));
    }

    if (const auto *task = std::get_if<Task>(&entity)) {
        object.insert(QStringLiteral("title"), task->title);
        object.insert(QStringLiteral("description"), nullableString(task->description));
        object.insert(QStringLiteral("task_type"), taskTypeToString(task->taskType));
        object.insert(QStringLiteral("recurrence_type"),
                      task->recurrenceType ? QJsonValue(recurrenceTypeToString(*task->recurrenceType))
                                           : QJsonValue(QJsonValue::Null));
        object.insert(QStringLiteral("recurrence_interval"), optionalInt(task->recurrenceInterval));
        object.insert(QStringLiteral("interval_days"), optionalInt(task->intervalDays));
        object.insert(QStringLiteral("reminder_time"), formatReminder(task->reminderTime));
        object.insert(QStringLiteral("group_id"), optionalInt(task->groupId));
        object.insert(QStringLiteral("enabled"), task->enabled);
        object.insert(QStringLiteral("completed"), task->completed);
        object.insert(QStringLiteral("assigned_user_ids"), idsToJson(task->assignedUserIds));
        if (task->lastShownAt.has_value()) {
            object.insert(QStringLiteral("last_shown_at"), *task->lastShownAt);
        }
        if (task->createdAt > 0) {
            object.insert(QStringLiteral("created_at"), task->createdAt);
        }
    } else if (const auto *user = std::get_if<User>(&entity)) {
        object.insert(QStringLiteral("name"), user->name);
        object.insert(QStringLiteral("email"), nullableString(user->email));
        object.insert(QStringLiteral("role"), user->role);
        object.insert(QStringLiteral("status"), user->status);
    } else if (const auto *group = std::get_if<Group>(&entity)) {
        object.insert(QStringLiteral("name"), group->name);
        object.insert(QStringLiteral("description"), nullableString(group->description));
        object.insert(QStringLiteral("created_by"), group->createdBy);
        object.insert(QStringLiteral("user_ids"), idsToJson(group->memberIds));
    }
    return object;
}

core::Result<Entity> EntityCodec::fromJson(EntityType type, const QJsonObject &object)
{
    switch (type) {
    case EntityType::User:
        return userFromJson(object);
    case EntityType::Group:
        return groupFromJson(object);
    case EntityType::Task:
    default:
        return taskFromJson(object);
    }
}

core::Result<Entity> EntityCodec::taskFromJson(const QJsonObject &object)
{
    if (!object.value(QStringLiteral("id")).isDouble()) {
        return core::Result<Entity>::fail(core::Error::validation(QStringLiteral("task without numeric id")));
    }

    Task task;
    task.id = object.value(QStringLiteral("id")).toInt();
    task.title = stringField(object, "title");
    task.description = stringField(object, "description");

    const auto taskType = taskTypeFromString(stringField(object, "task_type"));
    if (!taskType) {
        return core::Result<Entity>::fail(core::Error::validation(
            QStringLiteral("task %1: unknown task_type '%2'").arg(task.id).arg(stringField(object, "task_type"))));
    }
    task.taskType = *taskType;

    const QString recurrence = stringField(object, "recurrence_type");
    if (!recurrence.isEmpty()) {
        task.recurrenceType = recurrenceTypeFromString(recurrence);
        if (!task.recurrenceType) {
            return core::Result<Entity>::fail(core::Error::validation(
                QStringLiteral("task %1: unknown recurrence_type '%2'").arg(task.id).arg(recurrence)));
        }
    }

    if (!readOptionalInt(object, "recurrence_interval", task.recurrenceInterval)
        || !readOptionalInt(object, "interval_days", task.intervalDays)
        || !readOptionalInt(object, "group_id", task.groupId)) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("task %1: malformed numeric field").arg(task.id)));
    }

    task.reminderTime = parseReminder(stringField(object, "reminder_time"));
    if (!task.reminderTime.isValid()) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("task %1: missing or invalid reminder_time").arg(task.id)));
    }

    if (object.contains(QStringLiteral("enabled"))) {
        task.enabled = object.value(QStringLiteral("enabled")).toBool(true);
    } else {
        task.enabled = object.value(QStringLiteral("active")).toBool(true);
    }
    task.completed = object.value(QStringLiteral("completed")).toBool(false);

    const auto assigned = idsFromJson(object.value(QStringLiteral("assigned_user_ids")));
    if (!assigned) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("task %1: malformed assigned_user_ids").arg(task.id)));
    }
    task.assignedUserIds = *assigned;

    task.updatedAt = parseTimestamp(object.value(QStringLiteral("updated_at"))).value_or(0);
    task.createdAt = parseTimestamp(object.value(QStringLiteral("created_at"))).value_or(0);
    task.lastShownAt = parseTimestamp(object.value(QStringLiteral("last_shown_at")));
    return core::Result<Entity>::ok(Entity(std::move(task)));
}

core::Result<Entity> EntityCodec::userFromJson(const QJsonObject &object)
{
    if (!object.value(QStringLiteral("id")).isDouble()) {
        return core::Result<Entity>::fail(core::Error::validation(QStringLiteral("user without numeric id")));
    }

    User user;
    user.id = object.value(QStringLiteral("id")).toInt();
    user.name = stringField(object, "name");
    if (user.name.isEmpty()) {
        user.name = QStringLiteral("#%1").arg(user.id);
    }
    user.email = stringField(object, "email");
    user.role = stringField(object, "role");
    if (user.role.isEmpty()) {
        user.role = QStringLiteral("regular");
    }
    user.status = stringField(object, "status");
    if (user.status.isEmpty()) {
        user.status = object.value(QStringLiteral("is_active")).toBool(true) ? QStringLiteral("active")
                                                                              : QStringLiteral("inactive");
    }
    user.updatedAt = parseTimestamp(object.value(QStringLiteral("updated_at"))).value_or(0);
    user.createdAt = parseTimestamp(object.value(QStringLiteral("created_at"))).value_or(0);
    return core::Result<Entity>::ok(Entity(std::move(user)));
}

core::Result<Entity> EntityCodec::groupFromJson(const QJsonObject &object)
{
    if (!object.value(QStringLiteral("id")).isDouble()) {
        return core::Result<Entity>::fail(core::Error::validation(QStringLiteral("group without numeric id")));
    }

    Group group;
    group.id = object.value(QStringLiteral("id")).toInt();
    group.name = stringField(object, "name");
    group.description = stringField(object, "description");
    group.createdBy = object.value(QStringLiteral("created_by")).toInt(0);

    const QJsonValue members = object.contains(QStringLiteral("user_ids"))
        ? object.value(QStringLiteral("user_ids"))
        : object.value(QStringLiteral("member_ids"));
    const auto memberIds = idsFromJson(members);
    if (!memberIds) {
        return core::Result<Entity>::fail(
            core::Error::validation(QStringLiteral("group %1: malformed user_ids").arg(group.id)));
    }
    group.memberIds = *memberIds;
    group.updatedAt = parseTimestamp(object.value(QStringLiteral("updated_at"))).value_or(0);
    group.createdAt = parseTimestamp(object.value(QStringLiteral("created_at"))).value_or(0);
    return core::Result<Entity>::ok(Entity(std::move(group)));
}

QString EntityCodec::formatReminder(const QDateTime &reminder)
{
    if (!reminder.isValid()) {
        return QString();
    }
    return reminder.toString(QLatin1String(REMINDER_FORMAT));
}

QDateTime EntityCodec::parseReminder(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime parsed = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value, Qt::ISODate);
    }
    if (!parsed.isValid()) {
        return {};
    }
    // Wall-clock reading only; any zone suffix is dropped.
    const QTime time(parsed.time().hour(), parsed.time().minute(), parsed.time().second());
    return QDateTime(parsed.date(), time, Qt::UTC);
}

std::optional<qint64> EntityCodec::parseTimestamp(const QJsonValue &value)
{
    if (value.isDouble()) {
        return static_cast<qint64>(value.toDouble());
    }
    if (value.isString()) {
        bool ok = false;
        const qint64 millis = value.toString().toLongLong(&ok);
        if (ok) {
            return millis;
        }
        QDateTime parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        if (!parsed.isValid()) {
            return std::nullopt;
        }
        if (parsed.timeSpec() == Qt::LocalTime) {
            parsed.setTimeSpec(Qt::UTC);
        }
        return parsed.toMSecsSinceEpoch();
    }
    return std::nullopt;
}

QJsonArray EntityCodec::idsToJson(const QSet<int> &ids)
{
    QJsonArray array;
    for (const int id : sortedIds(ids)) {
        array.append(id);
    }
    return array;
}

std::optional<QSet<int>> EntityCodec::idsFromJson(const QJsonValue &value)
{
    QSet<int> ids;
    if (value.isUndefined() || value.isNull()) {
        return ids;
    }
    if (!value.isArray()) {
        return std::nullopt;
    }
    for (const QJsonValue &entry : value.toArray()) {
        if (!entry.isDouble()) {
            return std::nullopt;
        }
        ids.insert(entry.toInt());
    }
    return ids;
}

QString EntityCodec::idsToText(const QSet<int> &ids)
{
    return QString::fromUtf8(QJsonDocument(idsToJson(ids)).toJson(QJsonDocument::Compact));
}

QSet<int> EntityCodec::idsFromText(const QString &text)
{
    const QJsonDocument document = QJsonDocument::fromJson(text.toUtf8());
    return idsFromJson(document.isArray() ? QJsonValue(document.array()) : QJsonValue()).value_or(QSet<int>());
}

} // namespace data
} // namespace planner
