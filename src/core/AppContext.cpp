#include "planner/core/AppContext.hpp"

#include "planner/data/DataProvider.hpp"

#include "planner/core/Clock.hpp"
#include "planner/core/DayBoundaryEngine.hpp"
#include "planner/core/DayBoundaryScheduler.hpp"
#include "planner/core/Settings.hpp"
#include "planner/core/WakeAlarm.hpp"
#include "planner/data/CacheStore.hpp"
#include "planner/sync/HttpRemoteService.hpp"
#include "planner/sync/InMemoryRemoteService.hpp"
#include "planner/sync/RetentionPolicy.hpp"
#include "planner/sync/SyncDriver.hpp"
#include "planner/sync/SyncService.hpp"

namespace planner {
namespace core {

AppContext::AppContext(const AppOptions &options, std::unique_ptr<SettingsSource> settings)
    : m_settings(std::move(settings))
    , m_clock(std::make_shared<SystemClock>())
{
    const SyncSettings current = m_settings->current();
    m_databasePath =
        options.databasePath.isEmpty() ? data::DataProvider::resolveDatabasePath(current) : options.databasePath;
    m_dataProvider = std::make_unique<data::DataProvider>(m_databasePath, m_clock, *m_settings);

    if (options.loopback) {
        m_loopback = std::make_shared<sync::InMemoryRemoteService>(m_clock);
        m_remote = m_loopback;
    } else {
        m_remote = std::make_shared<sync::HttpRemoteService>(*m_settings);
    }

    m_dayBoundary = m_dataProvider->dayBoundaryEngine();
    m_retention = std::make_shared<sync::RetentionPolicy>(m_dataProvider->cacheStore(),
                                                          m_dataProvider->mutationQueue(), m_clock,
                                                          current.retentionCeilingBytes,
                                                          current.inactiveRetentionDays);
    m_syncService = std::make_unique<sync::SyncService>(m_dataProvider->cacheStore(), m_dataProvider->metadataStore(),
                                                        m_dataProvider->mutationQueue(), m_remote, m_dayBoundary,
                                                        m_retention, m_clock, *m_settings);
    m_wakeAlarm = std::make_unique<TimerWakeAlarm>(m_clock);
    m_scheduler = std::make_unique<DayBoundaryScheduler>(*m_wakeAlarm, m_clock, *m_settings);
    m_syncDriver = std::make_unique<sync::SyncDriver>(*m_syncService, *m_retention, *m_dayBoundary, *m_scheduler,
                                                      *m_settings);
}

AppContext::~AppContext()
{
    m_syncDriver->stop();
}

Result<bool> AppContext::open()
{
    const auto opened = m_dataProvider->open();
    if (!opened || !m_loopback) {
        return opened;
    }
    // The loopback remote starts from what this cache already knows remotely.
    for (const data::EntityType type : data::kAllEntityTypes) {
        for (const data::Entity &entity : m_dataProvider->cacheStore()->listByType(type)) {
            if (data::entityId(entity) > 0) {
                m_loopback->seed(entity);
            }
        }
    }
    return opened;
}

const SettingsSource &AppContext::settings() const
{
    return *m_settings;
}

const QString &AppContext::databasePath() const
{
    return m_databasePath;
}

data::DataProvider &AppContext::dataProvider()
{
    return *m_dataProvider;
}

data::OfflineRepository &AppContext::repository()
{
    return m_dataProvider->repository();
}

sync::SyncService &AppContext::syncService()
{
    return *m_syncService;
}

sync::RetentionPolicy &AppContext::retentionPolicy()
{
    return *m_retention;
}

DayBoundaryEngine &AppContext::dayBoundaryEngine()
{
    return *m_dayBoundary;
}

sync::SyncDriver &AppContext::syncDriver()
{
    return *m_syncDriver;
}

} // namespace core
} // namespace planner
