#include "planner/core/DayBoundaryScheduler.hpp"

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/Settings.hpp"
#include "planner/core/TaskDateCalculator.hpp"
#include "planner/core/WakeAlarm.hpp"

namespace planner {
namespace core {

namespace {
constexpr int kTriggerDelaySecs = 60;
} // namespace

DayBoundaryScheduler::DayBoundaryScheduler(WakeAlarm &alarm, std::shared_ptr<Clock> clock,
                                           const SettingsSource &settings, QObject *parent)
    : QObject(parent)
    , m_alarm(alarm)
    , m_clock(std::move(clock))
    , m_settings(settings)
{
    connect(&m_alarm, &WakeAlarm::fired, this, &DayBoundaryScheduler::onAlarmFired);
}

void DayBoundaryScheduler::start()
{
    m_running = true;
    rearm();

    // Boundaries passed while the process was not running are announced now;
    // the engine decides from its stored baseline whether a rollover is due.
    const QDateTime now = m_clock->now();
    m_lastDispatchedDay = TaskDateCalculator::logicalDay(now, m_settings.current().dayStartHour);
    qCDebug(lcDayBoundary) << "Announcing logical day" << m_lastDispatchedDay << "on start";
    emit dayBoundaryReached(now);
}

void DayBoundaryScheduler::stop()
{
    m_running = false;
    m_alarm.cancel();
    m_nextTrigger = QDateTime();
}

QDateTime DayBoundaryScheduler::nextTrigger() const
{
    return m_nextTrigger;
}

QDateTime DayBoundaryScheduler::nextTriggerAfter(const QDateTime &now, int dayStartHour)
{
    const QDateTime logicalNow = toLogical(now);
    const QDateTime todayTrigger =
        TaskDateCalculator::logicalDayStart(logicalNow, dayStartHour).addSecs(kTriggerDelaySecs);
    if (logicalNow < todayTrigger) {
        return todayTrigger;
    }
    return todayTrigger.addDays(1);
}

void DayBoundaryScheduler::onAlarmFired()
{
    if (!m_running) {
        return;
    }
    // Re-arm first.
    rearm();

    const QDateTime now = m_clock->now();
    const QDate day = TaskDateCalculator::logicalDay(now, m_settings.current().dayStartHour);
    if (m_lastDispatchedDay.isValid() && day <= m_lastDispatchedDay) {
        qCDebug(lcDayBoundary) << "Logical day" << day << "already announced";
        return;
    }
    m_lastDispatchedDay = day;
    qCInfo(lcDayBoundary) << "Day boundary reached, logical day" << day;
    emit dayBoundaryReached(now);
}

void DayBoundaryScheduler::rearm()
{
    m_nextTrigger = nextTriggerAfter(m_clock->now(), m_settings.current().dayStartHour);
    m_alarm.arm(m_nextTrigger);
}

} // namespace core
} // namespace planner
