#include "planner/data/Task.hpp"

namespace planner {
namespace data {

bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.description == rhs.description
        && lhs.taskType == rhs.taskType
        && lhs.recurrenceType == rhs.recurrenceType
        && lhs.recurrenceInterval == rhs.recurrenceInterval
        && lhs.intervalDays == rhs.intervalDays
        && lhs.reminderTime == rhs.reminderTime
        && lhs.groupId == rhs.groupId
        && lhs.enabled == rhs.enabled
        && lhs.completed == rhs.completed
        && lhs.assignedUserIds == rhs.assignedUserIds
        && lhs.updatedAt == rhs.updatedAt
        && lhs.lastAccessed == rhs.lastAccessed
        && lhs.lastShownAt == rhs.lastShownAt
        && lhs.createdAt == rhs.createdAt;
}

bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const User &lhs, const User &rhs)
{
    return lhs.id == rhs.id
        && lhs.name == rhs.name
        && lhs.email == rhs.email
        && lhs.role == rhs.role
        && lhs.status == rhs.status
        && lhs.updatedAt == rhs.updatedAt
        && lhs.lastAccessed == rhs.lastAccessed
        && lhs.createdAt == rhs.createdAt;
}

bool operator!=(const User &lhs, const User &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const Group &lhs, const Group &rhs)
{
    return lhs.id == rhs.id
        && lhs.name == rhs.name
        && lhs.description == rhs.description
        && lhs.createdBy == rhs.createdBy
        && lhs.memberIds == rhs.memberIds
        && lhs.updatedAt == rhs.updatedAt
        && lhs.lastAccessed == rhs.lastAccessed
        && lhs.createdAt == rhs.createdAt;
}

bool operator!=(const Group &lhs, const Group &rhs)
{
    return !(lhs == rhs);
}

QString taskTypeToString(TaskType type)
{
    switch (type) {
    case TaskType::Recurring:
        return QStringLiteral("recurring");
    case TaskType::Interval:
        return QStringLiteral("interval");
    case TaskType::OneTime:
    default:
        return QStringLiteral("one_time");
    }
}

std::optional<TaskType> taskTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("one_time")) {
        return TaskType::OneTime;
    }
    if (normalized == QLatin1String("recurring")) {
        return TaskType::Recurring;
    }
    if (normalized == QLatin1String("interval")) {
        return TaskType::Interval;
    }
    return std::nullopt;
}

QString recurrenceTypeToString(RecurrenceType type)
{
    switch (type) {
    case RecurrenceType::Weekdays:
        return QStringLiteral("weekdays");
    case RecurrenceType::Weekends:
        return QStringLiteral("weekends");
    case RecurrenceType::Weekly:
        return QStringLiteral("weekly");
    case RecurrenceType::Monthly:
        return QStringLiteral("monthly");
    case RecurrenceType::Yearly:
        return QStringLiteral("yearly");
    case RecurrenceType::Custom:
        return QStringLiteral("custom");
    case RecurrenceType::Interval:
        return QStringLiteral("interval");
    case RecurrenceType::Daily:
    default:
        return QStringLiteral("daily");
    }
}

std::optional<RecurrenceType> recurrenceTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("daily")) {
        return RecurrenceType::Daily;
    }
    if (normalized == QLatin1String("weekdays")) {
        return RecurrenceType::Weekdays;
    }
    if (normalized == QLatin1String("weekends")) {
        return RecurrenceType::Weekends;
    }
    if (normalized == QLatin1String("weekly")) {
        return RecurrenceType::Weekly;
    }
    if (normalized == QLatin1String("monthly")) {
        return RecurrenceType::Monthly;
    }
    if (normalized == QLatin1String("yearly")) {
        return RecurrenceType::Yearly;
    }
    if (normalized == QLatin1String("custom")) {
        return RecurrenceType::Custom;
    }
    if (normalized == QLatin1String("interval")) {
        return RecurrenceType::Interval;
    }
    return std::nullopt;
}

} // namespace data
} // namespace planner
