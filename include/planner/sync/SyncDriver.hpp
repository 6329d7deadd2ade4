#pragma once

#include <QDateTime>
#include <QObject>
#include <QTimer>

namespace planner {
namespace core {
class DayBoundaryEngine;
class DayBoundaryScheduler;
class SettingsSource;
}

namespace sync {

class RetentionPolicy;
class SyncService;

// Event-loop side of the engine: periodic sync cycles, an hourly retention
// pass and the day-boundary rollover when the scheduler announces a new day.
class SyncDriver : public QObject
{
    Q_OBJECT

public:
    SyncDriver(SyncService &syncService, RetentionPolicy &retention, core::DayBoundaryEngine &dayBoundary,
               core::DayBoundaryScheduler &scheduler, const core::SettingsSource &settings, QObject *parent = nullptr);

    void start();
    void stop();
    bool isRunning() const;

    int syncIntervalMs() const;

public slots:
    void syncNow();
    void runRetention();
    void onDayBoundary(const QDateTime &now);

private:
    SyncService &m_syncService;
    RetentionPolicy &m_retention;
    core::DayBoundaryEngine &m_dayBoundary;
    core::DayBoundaryScheduler &m_scheduler;
    const core::SettingsSource &m_settings;
    QTimer m_syncTimer;
    QTimer m_retentionTimer;
};

} // namespace sync
} // namespace planner
