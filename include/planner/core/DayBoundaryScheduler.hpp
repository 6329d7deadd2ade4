#pragma once

#include <QDate>
#include <QDateTime>
#include <QObject>

#include <memory>

namespace planner {
namespace core {

class Clock;
class SettingsSource;
class WakeAlarm;

// Arms the wake alarm one minute after each logical day start and announces
// the new day at most once. start() announces the current day as well, so a
// boundary missed while stopped is caught up. Consumers connect with
// Qt::QueuedConnection and run DayBoundaryEngine themselves.
class DayBoundaryScheduler : public QObject
{
    Q_OBJECT

public:
    DayBoundaryScheduler(WakeAlarm &alarm, std::shared_ptr<Clock> clock, const SettingsSource &settings,
                         QObject *parent = nullptr);

    void start();
    void stop();

    QDateTime nextTrigger() const;
    static QDateTime nextTriggerAfter(const QDateTime &now, int dayStartHour);

signals:
    void dayBoundaryReached(const QDateTime &now);

private slots:
    void onAlarmFired();

private:
    void rearm();

    WakeAlarm &m_alarm;
    std::shared_ptr<Clock> m_clock;
    const SettingsSource &m_settings;
    QDateTime m_nextTrigger;
    QDate m_lastDispatchedDay;
    bool m_running = false;
};

} // namespace core
} // namespace planner
