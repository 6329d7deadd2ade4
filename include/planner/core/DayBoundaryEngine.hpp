#pragma once

#include <QDate>
#include <QDateTime>

#include <memory>

#include "planner/core/Result.hpp"

namespace planner {
namespace data {
class CacheStore;
class MetadataStore;
}

namespace core {

struct DayRollover
{
    bool baselineRecorded = false;
    bool newDay = false;
    int advanced = 0;
    int deactivated = 0;
    QDate logicalDay;
};

// Recomputes completed tasks when a new logical day begins. The rollover is a
// local derivation: it keeps updatedAt and queues nothing.
class DayBoundaryEngine
{
public:
    DayBoundaryEngine(std::shared_ptr<data::CacheStore> cache, std::shared_ptr<data::MetadataStore> metadata);

    Result<DayRollover> runIfNewDay(const QDateTime &now, int dayStartHour);

private:
    Result<bool> recordBaseline(qint64 nowMillis, int dayStartHour);

    std::shared_ptr<data::CacheStore> m_cache;
    std::shared_ptr<data::MetadataStore> m_metadata;
};

} // namespace core
} // namespace planner
