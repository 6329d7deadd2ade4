#include "planner/sync/SyncDriver.hpp"

#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/core/DayBoundaryScheduler.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/Settings.hpp"
#include "planner/sync/RetentionPolicy.hpp"
#include "planner/sync/SyncService.hpp"

namespace planner {
namespace sync {

namespace {
constexpr int kRetentionIntervalMs = 60 * 60 * 1000;
}

SyncDriver::SyncDriver(SyncService &syncService, RetentionPolicy &retention, core::DayBoundaryEngine &dayBoundary,
                       core::DayBoundaryScheduler &scheduler, const core::SettingsSource &settings, QObject *parent)
    : QObject(parent)
    , m_syncService(syncService)
    , m_retention(retention)
    , m_dayBoundary(dayBoundary)
    , m_scheduler(scheduler)
    , m_settings(settings)
{
    m_syncTimer.setTimerType(Qt::VeryCoarseTimer);
    m_retentionTimer.setTimerType(Qt::VeryCoarseTimer);
    connect(&m_syncTimer, &QTimer::timeout, this, &SyncDriver::syncNow);
    connect(&m_retentionTimer, &QTimer::timeout, this, &SyncDriver::runRetention);
    connect(&m_scheduler, &core::DayBoundaryScheduler::dayBoundaryReached, this, &SyncDriver::onDayBoundary,
            Qt::QueuedConnection);
}

void SyncDriver::start()
{
    m_syncTimer.start(syncIntervalMs());
    m_retentionTimer.start(kRetentionIntervalMs);
    m_scheduler.start();
    qCInfo(lcSync) << "Sync driver started, interval" << m_syncTimer.interval() / 1000 << "s";
}

void SyncDriver::stop()
{
    m_syncTimer.stop();
    m_retentionTimer.stop();
    m_scheduler.stop();
}

bool SyncDriver::isRunning() const
{
    return m_syncTimer.isActive();
}

int SyncDriver::syncIntervalMs() const
{
    return m_settings.current().syncIntervalSeconds * 1000;
}

void SyncDriver::syncNow()
{
    const auto result = m_syncService.triggerSyncNow();
    if (!result) {
        qCWarning(lcSync) << "Sync cycle failed:" << core::errorKindName(result.error().kind)
                          << result.error().message;
    }
    // Interval changes take effect on the next cycle.
    const int interval = syncIntervalMs();
    if (m_syncTimer.isActive() && m_syncTimer.interval() != interval) {
        m_syncTimer.setInterval(interval);
    }
}

void SyncDriver::runRetention()
{
    const core::SyncSettings settings = m_settings.current();
    m_retention.setCeilingBytes(settings.retentionCeilingBytes);
    m_retention.setInactiveRetentionDays(settings.inactiveRetentionDays);
    m_retention.run();
}

void SyncDriver::onDayBoundary(const QDateTime &now)
{
    const auto rollover = m_dayBoundary.runIfNewDay(now, m_settings.current().dayStartHour);
    if (!rollover) {
        qCWarning(lcDayBoundary) << "Day rollover failed:" << rollover.error().message;
    }
}

} // namespace sync
} // namespace planner
