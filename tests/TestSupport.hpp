#pragma once

#include <QDate>
#include <QDateTime>
#include <QTemporaryDir>
#include <QTime>

#include <memory>

#include "planner/core/Clock.hpp"
#include "planner/core/Settings.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace testing {

inline QDateTime at(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

inline data::Task makeTask(int id, const QString &title, const QDateTime &reminder)
{
    data::Task task;
    task.id = id;
    task.title = title;
    task.reminderTime = reminder;
    return task;
}

inline data::Task makeDaily(int id, const QString &title, const QDateTime &reminder, int interval = 1)
{
    data::Task task = makeTask(id, title, reminder);
    task.taskType = data::TaskType::Recurring;
    task.recurrenceType = data::RecurrenceType::Daily;
    task.recurrenceInterval = interval;
    return task;
}

// Fresh database file in a temporary directory with a manual clock.
struct TestDatabase
{
    explicit TestDatabase(const QDateTime &now = at(2024, 3, 10, 9, 0), core::SyncSettings syncSettings = {})
        : clock(std::make_shared<core::ManualClock>(now))
        , settings(std::move(syncSettings))
        , provider(dir.filePath(QStringLiteral("planner.sqlite")), clock, settings)
    {
    }

    bool open() { return dir.isValid() && provider.open().isOk(); }

    QTemporaryDir dir;
    std::shared_ptr<core::ManualClock> clock;
    core::StaticSettingsSource settings;
    data::DataProvider provider;
};

} // namespace testing
} // namespace planner
