#include "planner/core/Clock.hpp"

namespace planner {
namespace core {

qint64 SystemClock::nowMillis() const
{
    return now().toMSecsSinceEpoch();
}

QDateTime SystemClock::now() const
{
    return toLogical(QDateTime::currentDateTime());
}

ManualClock::ManualClock(QDateTime now)
    : m_now(toLogical(now))
{
}

qint64 ManualClock::nowMillis() const
{
    return m_now.toMSecsSinceEpoch();
}

QDateTime ManualClock::now() const
{
    return m_now;
}

void ManualClock::setNow(const QDateTime &now)
{
    m_now = toLogical(now);
}

void ManualClock::advanceSecs(qint64 seconds)
{
    m_now = m_now.addSecs(seconds);
}

QDateTime toLogical(const QDateTime &wallClock)
{
    if (!wallClock.isValid()) {
        return {};
    }
    if (wallClock.timeSpec() == Qt::UTC) {
        return wallClock;
    }
    return QDateTime(wallClock.date(), wallClock.time(), Qt::UTC);
}

QDateTime logicalFromMillis(qint64 millis)
{
    return QDateTime::fromMSecsSinceEpoch(millis, Qt::UTC);
}

} // namespace core
} // namespace planner
