#pragma once

#include <QDateTime>
#include <QSet>
#include <QString>

#include <optional>

namespace planner {
namespace data {

enum class TaskType
{
    OneTime,
    Recurring,
    Interval,
};

enum class RecurrenceType
{
    Daily,
    Weekdays,
    Weekends,
    Weekly,
    Monthly,
    Yearly,
    Custom,
    Interval,
};

struct Task
{
    int id = 0;
    QString title;
    QString description;
    TaskType taskType = TaskType::OneTime;
    std::optional<RecurrenceType> recurrenceType;
    std::optional<int> recurrenceInterval;
    std::optional<int> intervalDays;
    QDateTime reminderTime;
    std::optional<int> groupId;
    bool enabled = true;
    bool completed = false;
    QSet<int> assignedUserIds;
    qint64 updatedAt = 0;
    qint64 lastAccessed = 0;
    std::optional<qint64> lastShownAt;
    qint64 createdAt = 0;

    bool isRepeating() const { return taskType != TaskType::OneTime; }
};

struct User
{
    int id = 0;
    QString name;
    QString email;
    QString role;
    QString status;
    qint64 updatedAt = 0;
    qint64 lastAccessed = 0;
    qint64 createdAt = 0;
};

struct Group
{
    int id = 0;
    QString name;
    QString description;
    int createdBy = 0;
    QSet<int> memberIds;
    qint64 updatedAt = 0;
    qint64 lastAccessed = 0;
    qint64 createdAt = 0;
};

bool operator==(const Task &lhs, const Task &rhs);
bool operator!=(const Task &lhs, const Task &rhs);
bool operator==(const User &lhs, const User &rhs);
bool operator!=(const User &lhs, const User &rhs);
bool operator==(const Group &lhs, const Group &rhs);
bool operator!=(const Group &lhs, const Group &rhs);

QString taskTypeToString(TaskType type);
std::optional<TaskType> taskTypeFromString(const QString &value);
QString recurrenceTypeToString(RecurrenceType type);
std::optional<RecurrenceType> recurrenceTypeFromString(const QString &value);

} // namespace data
} // namespace planner
