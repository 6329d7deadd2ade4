#pragma once

#include <QString>

#include <memory>

#include "planner/core/Result.hpp"

namespace planner {
namespace data {
class DataProvider;
class OfflineRepository;
}

namespace sync {
class InMemoryRemoteService;
class RemoteService;
class RetentionPolicy;
class SyncDriver;
class SyncService;
}

namespace core {

class Clock;
class DayBoundaryEngine;
class DayBoundaryScheduler;
class SettingsSource;
class TimerWakeAlarm;

struct AppOptions
{
    // Empty resolves through DataProvider::resolveDatabasePath().
    QString databasePath;
    // Syncs against an in-process remote instead of the HTTP endpoint.
    bool loopback = false;
};

// Wires the engine together for one process.
class AppContext
{
public:
    AppContext(const AppOptions &options, std::unique_ptr<SettingsSource> settings);
    ~AppContext();

    Result<bool> open();

    const SettingsSource &settings() const;
    const QString &databasePath() const;
    data::DataProvider &dataProvider();
    data::OfflineRepository &repository();
    sync::SyncService &syncService();
    sync::RetentionPolicy &retentionPolicy();
    DayBoundaryEngine &dayBoundaryEngine();
    sync::SyncDriver &syncDriver();

private:
    std::unique_ptr<SettingsSource> m_settings;
    std::shared_ptr<Clock> m_clock;
    QString m_databasePath;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::shared_ptr<sync::InMemoryRemoteService> m_loopback;
    std::shared_ptr<sync::RemoteService> m_remote;
    std::shared_ptr<DayBoundaryEngine> m_dayBoundary;
    std::shared_ptr<sync::RetentionPolicy> m_retention;
    std::unique_ptr<sync::SyncService> m_syncService;
    std::unique_ptr<TimerWakeAlarm> m_wakeAlarm;
    std::unique_ptr<DayBoundaryScheduler> m_scheduler;
    std::unique_ptr<sync::SyncDriver> m_syncDriver;
};

} // namespace core
} // namespace planner
