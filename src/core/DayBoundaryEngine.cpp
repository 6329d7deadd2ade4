#include "planner/core/DayBoundaryEngine.hpp"

#include <utility>
#include <vector>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/TaskDateCalculator.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/data/LocalDatabase.hpp"
#include "planner/data/MetadataStore.hpp"

namespace planner {
namespace core {

DayBoundaryEngine::DayBoundaryEngine(std::shared_ptr<data::CacheStore> cache,
                                     std::shared_ptr<data::MetadataStore> metadata)
    : m_cache(std::move(cache))
    , m_metadata(std::move(metadata))
{
}

Result<DayRollover> DayBoundaryEngine::runIfNewDay(const QDateTime &now, int dayStartHour)
{
    const QDateTime logicalNow = toLogical(now);
    const qint64 nowMillis = logicalNow.toMSecsSinceEpoch();

    DayRollover rollover;
    rollover.logicalDay = TaskDateCalculator::logicalDay(logicalNow, dayStartHour);

    const auto lastRun = m_metadata->integer(QString::fromLatin1(data::metadata_keys::DayBoundaryLastRun));
    const auto lastHour = m_metadata->integer(QString::fromLatin1(data::metadata_keys::DayBoundaryLastDayStartHour));
    if (!lastRun || !lastHour) {
        const auto recorded = recordBaseline(nowMillis, dayStartHour);
        if (!recorded) {
            return Result<DayRollover>::fail(recorded.error());
        }
        qCDebug(lcDayBoundary) << "No baseline yet, recorded logical day" << rollover.logicalDay;
        rollover.baselineRecorded = true;
        return Result<DayRollover>::ok(rollover);
    }

    if (!TaskDateCalculator::isNewDay(*lastRun, nowMillis, static_cast<int>(*lastHour), dayStartHour)) {
        return Result<DayRollover>::ok(rollover);
    }
    rollover.newDay = true;

    data::TransactionGuard transaction(m_cache->database());
    if (!transaction.isActive()) {
        return Result<DayRollover>::fail(Error::storage(QStringLiteral("cannot start day rollover transaction")));
    }

    std::vector<data::Entity> changed;
    for (data::Task task : m_cache->tasks()) {
        if (!task.completed) {
            continue;
        }
        if (task.isRepeating()) {
            task.reminderTime = TaskDateCalculator::calculateNextReminderTime(task, logicalNow, dayStartHour);
            task.completed = false;
            ++rollover.advanced;
        } else if (task.enabled) {
            task.enabled = false;
            ++rollover.deactivated;
        } else {
            continue;
        }
        changed.push_back(task);
    }

    const auto written = m_cache->upsert(changed);
    if (!written) {
        return Result<DayRollover>::fail(written.error());
    }
    const auto recorded = recordBaseline(nowMillis, dayStartHour);
    if (!recorded) {
        return Result<DayRollover>::fail(recorded.error());
    }
    if (!transaction.commit()) {
        return Result<DayRollover>::fail(Error::storage(QStringLiteral("day rollover commit failed")));
    }

    qCInfo(lcDayBoundary) << "New logical day" << rollover.logicalDay << "advanced" << rollover.advanced
                          << "deactivated" << rollover.deactivated;
    return Result<DayRollover>::ok(rollover);
}

Result<bool> DayBoundaryEngine::recordBaseline(qint64 nowMillis, int dayStartHour)
{
    const auto run = m_metadata->setInteger(QString::fromLatin1(data::metadata_keys::DayBoundaryLastRun), nowMillis);
    if (!run) {
        return run;
    }
    return m_metadata->setInteger(QString::fromLatin1(data::metadata_keys::DayBoundaryLastDayStartHour), dayStartHour);
}

} // namespace core
} // namespace planner
