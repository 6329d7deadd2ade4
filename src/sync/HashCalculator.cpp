#include "planner/sync/HashCalculator.hpp"

#include <QCryptographicHash>
#include <QStringList>

#include <algorithm>
#include <utility>

#include "planner/data/EntityCodec.hpp"

namespace planner {
namespace sync {

namespace {
QString optionalNumber(const std::optional<int> &value)
{
    return value.has_value() ? QString::number(*value) : QString();
}

QString boolText(bool value)
{
    return value ? QStringLiteral("true") : QStringLiteral("false");
}
} // namespace

QString HashCalculator::encodeTask(const data::Task &task)
{
    const QStringList fields{
        QString::number(task.id),
        task.title,
        task.description,
        data::taskTypeToString(task.taskType),
        task.recurrenceType ? data::recurrenceTypeToString(*task.recurrenceType) : QString(),
        optionalNumber(task.recurrenceInterval),
        optionalNumber(task.intervalDays),
        data::EntityCodec::formatReminder(task.reminderTime),
        optionalNumber(task.groupId),
        boolText(task.enabled),
        boolText(task.completed),
        joinIds(task.assignedUserIds),
        QString::number(task.updatedAt),
    };
    return fields.join(QLatin1Char('|'));
}

QString HashCalculator::taskHash(const data::Task &task)
{
    return sha256(encodeTask(task));
}

QString HashCalculator::userHash(const data::User &user)
{
    return sha256(QString::number(user.id) + QLatin1Char('|') + user.name + QLatin1Char('|') + user.status
                  + QLatin1Char('|') + QString::number(user.updatedAt));
}

QString HashCalculator::groupHash(const data::Group &group)
{
    return sha256(QString::number(group.id) + QLatin1Char('|') + group.name + QLatin1Char('|')
                  + joinIds(group.memberIds) + QLatin1Char('|') + QString::number(group.updatedAt));
}

QString HashCalculator::entityHash(const data::Entity &entity)
{
    if (const auto *task = std::get_if<data::Task>(&entity)) {
        return taskHash(*task);
    }
    if (const auto *user = std::get_if<data::User>(&entity)) {
        return userHash(*user);
    }
    return groupHash(std::get<data::Group>(entity));
}

QString HashCalculator::setHash(const std::vector<data::Entity> &entities)
{
    std::vector<std::pair<int, QString>> hashes;
    hashes.reserve(entities.size());
    for (const data::Entity &entity : entities) {
        hashes.emplace_back(data::entityId(entity), entityHash(entity));
    }
    std::sort(hashes.begin(), hashes.end());

    QString combined;
    for (const auto &entry : hashes) {
        combined += entry.second;
    }
    return sha256(combined);
}

QString HashCalculator::sha256(const QString &text)
{
    return QString::fromLatin1(QCryptographicHash::hash(text.toUtf8(), QCryptographicHash::Sha256).toHex());
}

QString HashCalculator::joinIds(const QSet<int> &ids)
{
    std::vector<int> sorted(ids.cbegin(), ids.cend());
    std::sort(sorted.begin(), sorted.end());
    QStringList parts;
    for (const int id : sorted) {
        parts << QString::number(id);
    }
    return parts.join(QLatin1Char(','));
}

} // namespace sync
} // namespace planner
