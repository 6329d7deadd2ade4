#pragma once

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QSet>
#include <QString>

#include <optional>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"

namespace planner {
namespace data {

// Snake-case JSON form of entities, shared by the remote adapters, queue
// payloads and the SQLite rows that keep id lists as JSON text.
class EntityCodec
{
public:
    static QJsonObject toJson(const Entity &entity);
    // Mutation payload; creates omit the temporary local id.
    static QJsonObject toPayload(const Entity &entity, bool includeId);
    // Unknown fields are ignored; malformed known fields are validation errors.
    static core::Result<Entity> fromJson(EntityType type, const QJsonObject &object);

    static QString formatReminder(const QDateTime &reminder);
    static QDateTime parseReminder(const QString &value);
    static std::optional<qint64> parseTimestamp(const QJsonValue &value);

    static QJsonArray idsToJson(const QSet<int> &ids);
    static std::optional<QSet<int>> idsFromJson(const QJsonValue &value);
    static QString idsToText(const QSet<int> &ids);
    static QSet<int> idsFromText(const QString &text);

private:
    static core::Result<Entity> taskFromJson(const QJsonObject &object);
    static core::Result<Entity> userFromJson(const QJsonObject &object);
    static core::Result<Entity> groupFromJson(const QJsonObject &object);
};

} // namespace data
} // namespace planner
