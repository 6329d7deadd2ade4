#include "planner/data/MetadataStore.hpp"

#include <QSqlQuery>
#include <QVariant>

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/data/LocalDatabase.hpp"

namespace planner {
namespace data {

namespace metadata_keys {
QString lastPullHash(EntityType type)
{
    return QStringLiteral("last_pull_hash.%1").arg(entityTypeToString(type));
}
} // namespace metadata_keys

MetadataStore::MetadataStore(std::shared_ptr<LocalDatabase> database, std::shared_ptr<core::Clock> clock)
    : m_database(std::move(database))
    , m_clock(std::move(clock))
{
}

std::optional<QString> MetadataStore::value(const QString &key) const
{
    ReadGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("SELECT value FROM metadata WHERE key = :key"));
    query.bindValue(QStringLiteral(":key"), key);
    if (!query.exec()) {
        LocalDatabase::queryError(query, QStringLiteral("metadata read %1").arg(key));
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }
    return query.value(0).toString();
}

std::optional<qint64> MetadataStore::integer(const QString &key) const
{
    const auto text = value(key);
    if (!text) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 parsed = text->toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

core::Result<bool> MetadataStore::setValue(const QString &key, const QString &value)
{
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral(R"SQL(
        INSERT INTO metadata (key, value, updated_at) VALUES (:key, :value, :updated_at)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at
    )SQL"));
    query.bindValue(QStringLiteral(":key"), key);
    query.bindValue(QStringLiteral(":value"), value);
    query.bindValue(QStringLiteral(":updated_at"), m_clock->nowMillis());
    if (!query.exec()) {
        return core::Result<bool>::fail(LocalDatabase::queryError(query, QStringLiteral("metadata write %1").arg(key)));
    }
    return core::Result<bool>::ok(true);
}

core::Result<bool> MetadataStore::setInteger(const QString &key, qint64 value)
{
    return setValue(key, QString::number(value));
}

core::Result<bool> MetadataStore::remove(const QString &key)
{
    WriteGuard guard(*m_database);
    QSqlQuery query(m_database->connection());
    query.prepare(QStringLiteral("DELETE FROM metadata WHERE key = :key"));
    query.bindValue(QStringLiteral(":key"), key);
    if (!query.exec()) {
        return core::Result<bool>::fail(LocalDatabase::queryError(query, QStringLiteral("metadata delete %1").arg(key)));
    }
    return core::Result<bool>::ok(query.numRowsAffected() > 0);
}

} // namespace data
} // namespace planner
