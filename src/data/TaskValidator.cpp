#include "planner/data/TaskValidator.hpp"

namespace planner {
namespace data {

QStringList TaskValidator::violations(const Entity &entity)
{
    QStringList errors;
    if (const auto *task = std::get_if<Task>(&entity)) {
        checkTask(*task, errors);
    } else if (const auto *user = std::get_if<User>(&entity)) {
        if (user->name.trimmed().isEmpty()) {
            errors << QStringLiteral("name: user name cannot be empty");
        }
    } else if (const auto *group = std::get_if<Group>(&entity)) {
        if (group->name.trimmed().isEmpty()) {
            errors << QStringLiteral("name: group name cannot be empty");
        }
    }
    return errors;
}

core::Result<bool> TaskValidator::validate(const Entity &entity)
{
    const QStringList errors = violations(entity);
    if (errors.isEmpty()) {
        return core::Result<bool>::ok(true);
    }
    return core::Result<bool>::fail(core::Error::validation(errors.join(QStringLiteral("; "))));
}

void TaskValidator::checkTask(const Task &task, QStringList &errors)
{
    if (task.title.trimmed().isEmpty()) {
        errors << QStringLiteral("title: title cannot be empty");
    } else if (task.title.length() > kMaxTitleLength) {
        errors << QStringLiteral("title: title cannot exceed %1 characters").arg(kMaxTitleLength);
    }

    if (task.description.length() > kMaxDescriptionLength) {
        errors << QStringLiteral("description: description cannot exceed %1 characters").arg(kMaxDescriptionLength);
    }

    if (!task.reminderTime.isValid()) {
        errors << QStringLiteral("reminder_time: reminder time is required");
    }

    if (task.isRepeating()) {
        if (!task.recurrenceType.has_value()) {
            errors << QStringLiteral("recurrence_type: repeating tasks need a recurrence type");
        }
        if (!task.recurrenceInterval.has_value() || *task.recurrenceInterval <= 0) {
            errors << QStringLiteral("recurrence_interval: repeating tasks need a positive interval");
        }
    }

    if (task.intervalDays.has_value() && *task.intervalDays <= 0) {
        errors << QStringLiteral("interval_days: interval days must be positive");
    }
}

} // namespace data
} // namespace planner
