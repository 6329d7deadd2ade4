#include "planner/core/WakeAlarm.hpp"

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/Logging.hpp"

namespace planner {
namespace core {

namespace {
constexpr qint64 kMaxChunkMs = 60 * 60 * 1000;
} // namespace

TimerWakeAlarm::TimerWakeAlarm(std::shared_ptr<Clock> clock, QObject *parent)
    : WakeAlarm(parent)
    , m_clock(std::move(clock))
{
    m_timer.setSingleShot(true);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &TimerWakeAlarm::onTimeout);
}

void TimerWakeAlarm::arm(const QDateTime &at)
{
    m_target = toLogical(at);
    schedule();
}

void TimerWakeAlarm::cancel()
{
    m_timer.stop();
    m_target = QDateTime();
}

bool TimerWakeAlarm::isArmed() const
{
    return m_target.isValid();
}

QDateTime TimerWakeAlarm::target() const
{
    return m_target;
}

void TimerWakeAlarm::onTimeout()
{
    if (!m_target.isValid()) {
        return;
    }
    if (m_clock->now() < m_target) {
        schedule();
        return;
    }
    m_target = QDateTime();
    emit fired();
}

void TimerWakeAlarm::schedule()
{
    const qint64 remaining = qMax<qint64>(0, m_clock->now().msecsTo(m_target));
    m_timer.start(static_cast<int>(qMin(remaining, kMaxChunkMs)));
    qCDebug(lcDayBoundary) << "Alarm armed for" << m_target << "in" << remaining << "ms";
}

} // namespace core
} // namespace planner
