#include "planner/core/TaskDateCalculator.hpp"

#include <QTime>

#include "planner/core/Clock.hpp"

namespace planner {
namespace core {

namespace {
bool isWeekend(const QDate &date)
{
    return date.dayOfWeek() >= Qt::Saturday;
}

QDateTime nthMatchingDay(const QDateTime &from, int count, bool weekend)
{
    QDateTime cursor = from;
    int found = 0;
    while (found < count) {
        cursor = cursor.addDays(1);
        if (isWeekend(cursor.date()) == weekend) {
            ++found;
        }
    }
    return cursor;
}
} // namespace

QDateTime TaskDateCalculator::logicalDayStart(const QDateTime &time, int dayStartHour)
{
    const QDateTime logical = toLogical(time);
    QDateTime start(logical.date(), QTime(dayStartHour, 0), Qt::UTC);
    if (logical < start) {
        start = start.addDays(-1);
    }
    return start;
}

QDate TaskDateCalculator::logicalDay(const QDateTime &time, int dayStartHour)
{
    return logicalDayStart(time, dayStartHour).date();
}

QDateTime TaskDateCalculator::nextDayStart(const QDateTime &time, int dayStartHour)
{
    return logicalDayStart(time, dayStartHour).addDays(1);
}

bool TaskDateCalculator::isNewDay(qint64 lastUpdateMillis, qint64 nowMillis, int lastDayStartHour,
                                  int currentDayStartHour)
{
    const QDate lastDay = logicalDay(logicalFromMillis(lastUpdateMillis), lastDayStartHour);
    const QDate currentDay = logicalDay(logicalFromMillis(nowMillis), currentDayStartHour);
    return lastDay != currentDay;
}

QDateTime TaskDateCalculator::calculateNextReminderTime(const data::Task &task, const QDateTime &now,
                                                        int dayStartHour)
{
    const QDateTime reminder = toLogical(task.reminderTime);
    const QDateTime current = toLogical(now);
    if (!task.isRepeating() || !reminder.isValid() || reminder > current) {
        return reminder;
    }

    const int days = stepDays(task);
    int steps = 1;
    if (days > 0) {
        // Skip whole logical days at once, then finish with single steps.
        const qint64 behind = logicalDay(reminder, dayStartHour).daysTo(logicalDay(current, dayStartHour));
        if (behind > days) {
            steps = static_cast<int>(behind / days);
        }
    }

    QDateTime next = advance(reminder, task, steps);
    while (next <= current) {
        ++steps;
        next = advance(reminder, task, steps);
    }
    return next;
}

bool TaskDateCalculator::isVisibleToday(const data::Task &task, const QDateTime &now, int dayStartHour)
{
    if (!task.reminderTime.isValid()) {
        return false;
    }
    const QDate today = logicalDay(now, dayStartHour);
    const QDate due = logicalDay(task.reminderTime, dayStartHour);
    if (!task.isRepeating()) {
        return due <= today || task.completed;
    }
    return due <= today;
}

std::vector<data::Task> TaskDateCalculator::filterToday(const std::vector<data::Task> &tasks, const QDateTime &now,
                                                        int dayStartHour, std::optional<int> userId)
{
    std::vector<data::Task> result;
    for (const data::Task &task : tasks) {
        if (!isVisibleToday(task, now, dayStartHour)) {
            continue;
        }
        if (userId.has_value() && !task.assignedUserIds.isEmpty() && !task.assignedUserIds.contains(*userId)) {
            continue;
        }
        result.push_back(task);
    }
    return result;
}

QDateTime TaskDateCalculator::advance(const QDateTime &base, const data::Task &task, int steps)
{
    const int interval = qMax(1, task.recurrenceInterval.value_or(1));
    const data::RecurrenceType type = task.recurrenceType.value_or(
        task.taskType == data::TaskType::Interval ? data::RecurrenceType::Interval : data::RecurrenceType::Daily);

    switch (type) {
    case data::RecurrenceType::Monthly:
        return QDateTime(base.date().addMonths(interval * steps), base.time(), Qt::UTC);
    case data::RecurrenceType::Yearly:
        return QDateTime(base.date().addYears(interval * steps), base.time(), Qt::UTC);
    case data::RecurrenceType::Weekdays:
        return nthMatchingDay(base, interval * steps, false);
    case data::RecurrenceType::Weekends:
        return nthMatchingDay(base, interval * steps, true);
    case data::RecurrenceType::Daily:
    case data::RecurrenceType::Weekly:
    case data::RecurrenceType::Custom:
    case data::RecurrenceType::Interval:
    default:
        return base.addDays(qint64(stepDays(task)) * steps);
    }
}

int TaskDateCalculator::stepDays(const data::Task &task)
{
    const int interval = qMax(1, task.recurrenceInterval.value_or(1));
    const data::RecurrenceType type = task.recurrenceType.value_or(
        task.taskType == data::TaskType::Interval ? data::RecurrenceType::Interval : data::RecurrenceType::Daily);

    switch (type) {
    case data::RecurrenceType::Daily:
        return interval;
    case data::RecurrenceType::Weekly:
        return 7 * interval;
    case data::RecurrenceType::Custom:
    case data::RecurrenceType::Interval:
        return qMax(1, task.intervalDays.value_or(interval));
    case data::RecurrenceType::Weekdays:
    case data::RecurrenceType::Weekends:
    case data::RecurrenceType::Monthly:
    case data::RecurrenceType::Yearly:
    default:
        return 0;
    }
}

} // namespace core
} // namespace planner
