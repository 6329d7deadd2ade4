#pragma once

#include <QString>

#include <memory>
#include <optional>

#include "planner/core/Result.hpp"
#include "planner/data/Entity.hpp"

namespace planner {
namespace core {
class Clock;
}

namespace data {

class LocalDatabase;

namespace metadata_keys {
constexpr auto DayBoundaryLastRun = "day_boundary.last_run_ms";
constexpr auto DayBoundaryLastDayStartHour = "day_boundary.last_day_start_hour";
constexpr auto LastSuccessfulSync = "last_successful_sync_ms";

QString lastPullHash(EntityType type);
} // namespace metadata_keys

class MetadataStore
{
public:
    MetadataStore(std::shared_ptr<LocalDatabase> database, std::shared_ptr<core::Clock> clock);

    std::optional<QString> value(const QString &key) const;
    std::optional<qint64> integer(const QString &key) const;
    core::Result<bool> setValue(const QString &key, const QString &value);
    core::Result<bool> setInteger(const QString &key, qint64 value);
    core::Result<bool> remove(const QString &key);

private:
    std::shared_ptr<LocalDatabase> m_database;
    std::shared_ptr<core::Clock> m_clock;
};

} // namespace data
} // namespace planner
