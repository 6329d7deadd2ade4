#pragma once

#include <QDate>
#include <QDateTime>

#include <optional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace core {

// Logical-day arithmetic. A logical day starts at dayStartHour:00 instead of
// midnight; all times are zone-free wall-clock readings.
class TaskDateCalculator
{
public:
    static QDateTime logicalDayStart(const QDateTime &time, int dayStartHour);
    static QDate logicalDay(const QDateTime &time, int dayStartHour);
    static QDateTime nextDayStart(const QDateTime &time, int dayStartHour);

    static bool isNewDay(qint64 lastUpdateMillis, qint64 nowMillis, int lastDayStartHour, int currentDayStartHour);

    // One-time tasks come back unchanged. Repeating tasks due at or before now
    // advance by whole steps until strictly after now, keeping the time of day.
    static QDateTime calculateNextReminderTime(const data::Task &task, const QDateTime &now, int dayStartHour);

    static bool isVisibleToday(const data::Task &task, const QDateTime &now, int dayStartHour);
    static std::vector<data::Task> filterToday(const std::vector<data::Task> &tasks, const QDateTime &now,
                                               int dayStartHour, std::optional<int> userId = std::nullopt);

private:
    static QDateTime advance(const QDateTime &base, const data::Task &task, int steps);
    static int stepDays(const data::Task &task);
};

} // namespace core
} // namespace planner
